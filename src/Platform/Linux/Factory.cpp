#include "Platform/Factory.h"

#include "LinuxPathProvider.h"
#include "LinuxProcessActions.h"
#include "LinuxProcessProbe.h"

#include <memory>

namespace Platform
{

std::unique_ptr<IProcessProbe> makeProcessProbe()
{
    return std::make_unique<LinuxProcessProbe>();
}

std::unique_ptr<IProcessActions> makeProcessActions()
{
    return std::make_unique<LinuxProcessActions>();
}

std::unique_ptr<IPathProvider> makePathProvider()
{
    return std::make_unique<LinuxPathProvider>();
}

} // namespace Platform

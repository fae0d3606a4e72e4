#pragma once

#include "Platform/IProcessActions.h"

#include <cstdint>
#include <string_view>

namespace Platform
{

/// POSIX signal delivery via kill(2).
class LinuxProcessActions : public IProcessActions
{
  public:
    LinuxProcessActions();
    ~LinuxProcessActions() override = default;

    LinuxProcessActions(const LinuxProcessActions&) = delete;
    LinuxProcessActions& operator=(const LinuxProcessActions&) = delete;
    LinuxProcessActions(LinuxProcessActions&&) = default;
    LinuxProcessActions& operator=(LinuxProcessActions&&) = default;

    [[nodiscard]] ProcessActionCapabilities actionCapabilities() const override;
    [[nodiscard]] ProcessActionResult terminate(std::int32_t pid) override;
    [[nodiscard]] ProcessActionResult kill(std::int32_t pid) override;
    [[nodiscard]] bool isRunning(std::int32_t pid) const override;
    [[nodiscard]] bool isProtected(std::int32_t pid) const override;

  private:
    [[nodiscard]] ProcessActionResult sendSignal(std::int32_t pid, int signal, std::string_view signalName) const;

    std::int32_t m_SelfPid = 0;
};

} // namespace Platform

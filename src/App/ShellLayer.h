#pragma once

#include "Core/Layer.h"
#include "Domain/IRecordSource.h"
#include "Domain/QueryFacade.h"
#include "Domain/RefreshCoordinator.h"
#include "Domain/SnapshotCache.h"
#include "Panels/ListenersPanel.h"

#include <memory>

namespace App
{

/// Top-level layer: owns the cache stack, the listeners panel, menu bar and status bar.
class ShellLayer : public Core::Layer
{
  public:
    ShellLayer();
    ~ShellLayer() override;

    ShellLayer(const ShellLayer&) = delete;
    ShellLayer& operator=(const ShellLayer&) = delete;
    ShellLayer(ShellLayer&&) = delete;
    ShellLayer& operator=(ShellLayer&&) = delete;

    void onAttach() override;
    void onDetach() override;
    void onUpdate(float deltaTime) override;
    void onRender() override;

    /// Busy while a query is waiting on the cache so the spinner keeps animating.
    [[nodiscard]] bool isBusy() const override;

  private:
    void setupWorkspace();
    void renderMenuBar();
    void renderCacheSettingsMenu();
    void renderStatusBar() const;
    void applyCacheSettings();

    // Declaration order is teardown order in reverse: panel, facade, coordinator, cache
    std::shared_ptr<Domain::IRecordSource> m_Source;
    std::unique_ptr<Domain::SnapshotCache> m_Cache;
    std::unique_ptr<Domain::RefreshCoordinator> m_Coordinator;
    std::unique_ptr<Domain::QueryFacade> m_Facade;
    std::unique_ptr<ListenersPanel> m_ListenersPanel;

    bool m_ShowListeners = true;
};

} // namespace App

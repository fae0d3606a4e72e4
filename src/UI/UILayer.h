#pragma once

#include "Core/Layer.h"

namespace UI
{

/// Owns the Dear ImGui context. Pushed first, so its onRender opens the frame
/// for every layer above it and its onPostRender submits it.
class UILayer : public Core::Layer
{
  public:
    UILayer();
    ~UILayer() override;

    UILayer(const UILayer&) = delete;
    UILayer& operator=(const UILayer&) = delete;
    UILayer(UILayer&&) = delete;
    UILayer& operator=(UILayer&&) = delete;

    void onAttach() override;
    void onDetach() override;
    void onRender() override;
    void onPostRender() override;
};

} // namespace UI

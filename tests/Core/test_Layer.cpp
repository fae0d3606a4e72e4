/// @file test_Layer.cpp
/// @brief Tests for Core::Layer base class
///
/// Tests cover:
/// - Naming and the default no-op lifecycle
/// - Overridden lifecycle hooks dispatched through the base class
/// - The busy flag the main loop uses to decide between polling and waiting

#include "Core/Layer.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

/// Records every lifecycle call it receives
class RecordingLayer : public Core::Layer
{
  public:
    explicit RecordingLayer(std::string name = "RecordingLayer") : Layer(std::move(name))
    {
    }

    void onAttach() override
    {
        calls.emplace_back("attach");
    }

    void onDetach() override
    {
        calls.emplace_back("detach");
    }

    void onUpdate(float deltaTime) override
    {
        calls.emplace_back("update");
        lastDelta = deltaTime;
    }

    void onRender() override
    {
        calls.emplace_back("render");
    }

    void onPostRender() override
    {
        calls.emplace_back("postRender");
    }

    [[nodiscard]] bool isBusy() const override
    {
        return busy;
    }

    std::vector<std::string> calls;
    float lastDelta = 0.0F;
    bool busy = false;
};

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(LayerTest, DefaultName)
{
    const Core::Layer layer;
    EXPECT_EQ(layer.getName(), "Layer");
}

TEST(LayerTest, CustomName)
{
    const Core::Layer layer("ShellLayer");
    EXPECT_EQ(layer.getName(), "ShellLayer");
}

TEST(LayerTest, DefaultHooksAreNoOps)
{
    Core::Layer layer;
    EXPECT_NO_THROW(layer.onAttach());
    EXPECT_NO_THROW(layer.onUpdate(0.016F));
    EXPECT_NO_THROW(layer.onRender());
    EXPECT_NO_THROW(layer.onPostRender());
    EXPECT_NO_THROW(layer.onDetach());
}

TEST(LayerTest, DefaultLayerIsNeverBusy)
{
    const Core::Layer layer;
    EXPECT_FALSE(layer.isBusy());
}

// =============================================================================
// Dispatch through the base class
// =============================================================================

TEST(LayerTest, FrameSequenceDispatchesToOverrides)
{
    auto recording = std::make_unique<RecordingLayer>();
    RecordingLayer* raw = recording.get();
    std::unique_ptr<Core::Layer> layer = std::move(recording);

    layer->onAttach();
    layer->onUpdate(0.25F);
    layer->onRender();
    layer->onPostRender();
    layer->onDetach();

    const std::vector<std::string> expected{"attach", "update", "render", "postRender", "detach"};
    EXPECT_EQ(raw->calls, expected);
    EXPECT_FLOAT_EQ(raw->lastDelta, 0.25F);
}

TEST(LayerTest, BusyFlagIsVisibleThroughBase)
{
    RecordingLayer recording;
    const Core::Layer& base = recording;

    EXPECT_FALSE(base.isBusy());
    recording.busy = true;
    EXPECT_TRUE(base.isBusy());
}

TEST(LayerTest, CopyPreservesName)
{
    const Core::Layer original("Original");
    const Core::Layer copy(original); // NOLINT(performance-unnecessary-copy-initialization)
    EXPECT_EQ(copy.getName(), "Original");
}

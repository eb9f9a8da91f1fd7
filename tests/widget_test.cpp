#include <gtest/gtest.h>
#include "widget.hpp"
#include "error_manager.hpp"

// WidgetState builds without a window: the frame texture is only sized later
class WidgetTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::setCatalogue(bootstrap_config::defaultErrors());
        connectCore(state);
    }

    WidgetState state{WidgetSettings{}};
};

// ============================================================
// Core wiring
// ============================================================
TEST_F(WidgetTest, StartsStoppedWithZeroText) {
    EXPECT_FALSE(state.refresh.active);
    EXPECT_EQ(state.timeText.main, "00:00:00");
    EXPECT_EQ(state.timeText.hundredths, ".00");
}

TEST_F(WidgetTest, RefreshTickRunsOnlyWhileRunning) {
    state.core.start();
    EXPECT_TRUE(state.refresh.active);

    state.core.pause();
    EXPECT_FALSE(state.refresh.active);

    state.core.start();
    EXPECT_TRUE(state.refresh.active);

    state.core.reset();
    EXPECT_FALSE(state.refresh.active);
}

TEST_F(WidgetTest, TextRefreshedOnEveryTransition) {
    state.core.start();
    state.timeText = TimeText{"stale", ".xx"};

    state.core.pause();
    TimeText expected = formatElapsed(state.core.elapsed());
    EXPECT_EQ(state.timeText.main, expected.main);
    EXPECT_EQ(state.timeText.hundredths, expected.hundredths);

    state.timeText = TimeText{"stale", ".xx"};
    state.core.reset();
    EXPECT_EQ(state.timeText.main, "00:00:00");
    EXPECT_EQ(state.timeText.hundredths, ".00");
}

TEST_F(WidgetTest, TickIntervalComesFromSettings) {
    WidgetSettings s;
    s.tickIntervalMs = 3;
    WidgetState fast(s);
    EXPECT_EQ(fast.refresh.interval, std::chrono::milliseconds(10));
}

// ============================================================
// Controls row and "+" button
// ============================================================
TEST_F(WidgetTest, HidingControlsClearsAspectLock) {
    toggleControls(state);
    EXPECT_TRUE(state.controlsVisible);

    state.aspectLocked = true;
    toggleControls(state);
    EXPECT_FALSE(state.controlsVisible);
    EXPECT_FALSE(state.aspectLocked);
}

TEST_F(WidgetTest, SingleClickOnAddTogglesControls) {
    EXPECT_FALSE(clickAddButton(state, 0));
    EXPECT_TRUE(state.controlsVisible);

    EXPECT_FALSE(clickAddButton(state, 1000));
    EXPECT_FALSE(state.controlsVisible);
}

TEST_F(WidgetTest, DoubleClickOnAddShowsControlsAndAsksForImage) {
    EXPECT_FALSE(clickAddButton(state, 0));
    EXPECT_TRUE(clickAddButton(state, 200));
    // First click showed the row, the second one only opens the picker
    EXPECT_TRUE(state.controlsVisible);

    // A following click is a fresh single click
    EXPECT_FALSE(clickAddButton(state, 300));
    EXPECT_FALSE(state.controlsVisible);
}

// ============================================================
// Background
// ============================================================
TEST_F(WidgetTest, ResetBackgroundRestoresDefaults) {
    state.controlsVisible = true;
    state.aspectLocked = true;
    setBackgroundAlpha(state, 30);

    resetBackground(state);
    EXPECT_FALSE(state.background.hasImage());
    EXPECT_EQ(state.background.alpha(), kDefaultBackgroundAlpha);
    EXPECT_FALSE(state.controlsVisible);
    EXPECT_FALSE(state.aspectLocked);
}

TEST_F(WidgetTest, FailedImageUnlocksAndFlashesError) {
    state.aspectLocked = true;

    applyBackgroundImage(state, "/nonexistent/nekotoki/cat.png");
    EXPECT_FALSE(state.aspectLocked);
    EXPECT_FALSE(state.background.hasImage());
    EXPECT_EQ(state.statusText, "Could not load that image.");
    EXPECT_FLOAT_EQ(state.statusRemaining, kStatusSeconds);
}

TEST_F(WidgetTest, SliderAlphaIsClamped) {
    setBackgroundAlpha(state, 400);
    EXPECT_EQ(state.background.alpha(), 255);
}

// ============================================================
// Status line
// ============================================================
TEST_F(WidgetTest, EmptyMessagesAreNotFlashed) {
    flashStatus(state, okResult());
    EXPECT_TRUE(state.statusText.empty());
    EXPECT_FLOAT_EQ(state.statusRemaining, 0.f);

    flashStatus(state, okResult("Background set"));
    EXPECT_EQ(state.statusText, "Background set");
}

TEST_F(WidgetTest, StatusClearsAfterTimeout) {
    flashStatus(state, okResult("Background set"));
    updateWidget(state, kStatusSeconds / 2.f);
    EXPECT_FALSE(state.statusText.empty());

    updateWidget(state, kStatusSeconds);
    EXPECT_TRUE(state.statusText.empty());
    EXPECT_FLOAT_EQ(state.statusRemaining, 0.f);
}

TEST_F(WidgetTest, HintAppearsAfterHoverDelay) {
    state.hoverPart = WidgetPart::AddButton;
    updateWidget(state, 0.1f);
    EXPECT_EQ(activeHint(state), nullptr);

    updateWidget(state, kHintDelaySeconds);
    ASSERT_NE(activeHint(state), nullptr);
    EXPECT_STREQ(activeHint(state), hintFor(WidgetPart::AddButton));

    // Moving to another control restarts the delay
    state.hoverPart = WidgetPart::CloseButton;
    updateWidget(state, 0.1f);
    EXPECT_EQ(activeHint(state), nullptr);
}

TEST_F(WidgetTest, NoHintWhileDragging) {
    state.hoverPart = WidgetPart::ChangeImage;
    updateWidget(state, 0.f);
    updateWidget(state, 1.f);
    ASSERT_NE(activeHint(state), nullptr);

    state.mode = WidgetState::Mode::Dragging;
    EXPECT_EQ(activeHint(state), nullptr);
}

#include <gtest/gtest.h>

#include "app_state.h"
#include "fakes.h"

class ApplicationStateTest : public ::testing::Test {
protected:
    FakeClickSink    sink;
    ApplicationState state{ sink };
};

TEST_F(ApplicationStateTest, StartsIdleWithNoSelection)
{
    EXPECT_TRUE(state.IsIdle());
    EXPECT_FALSE(state.IsDragging());
    EXPECT_FALSE(state.Selection().has_value());
    EXPECT_FALSE(state.IsProcessing());
    EXPECT_EQ(state.Files().Next(), 1u);
}

TEST_F(ApplicationStateTest, AutoClickerFollowsDefaultSettings)
{
    EXPECT_FALSE(state.AutoClick().IsEnabled());
    EXPECT_EQ(state.AutoClick().Interval(), std::chrono::milliseconds(1000));
    EXPECT_EQ(state.AutoClick().MaxCount(), 0u);
    EXPECT_FALSE(state.AutoClick().IsRunning());
}

TEST_F(ApplicationStateTest, ModeIsExclusive)
{
    state.SetMode(AppMode::Capturing);
    EXPECT_TRUE(state.IsCapturing());
    EXPECT_FALSE(state.IsIdle());
    EXPECT_FALSE(state.IsAreaSelecting());
    EXPECT_FALSE(state.IsExportingPdf());
}

TEST_F(ApplicationStateTest, DragOnlyStartsInAreaSelection)
{
    EXPECT_FALSE(state.BeginDrag({ 1, 2 }));
    EXPECT_FALSE(state.IsDragging());

    state.SetMode(AppMode::AreaSelecting);
    EXPECT_TRUE(state.BeginDrag({ 1, 2 }));
    EXPECT_TRUE(state.IsDragging());
    EXPECT_EQ(state.DragAnchor(), (ScreenPoint{ 1, 2 }));
    EXPECT_EQ(state.DragCurrent(), (ScreenPoint{ 1, 2 }));
}

TEST_F(ApplicationStateTest, LeavingAreaSelectionClearsDragging)
{
    state.SetMode(AppMode::AreaSelecting);
    state.BeginDrag({ 5, 5 });
    state.SetMode(AppMode::Idle);
    EXPECT_FALSE(state.IsDragging());
    EXPECT_TRUE(state.DragRect().IsEmpty());
}

TEST_F(ApplicationStateTest, FinishDragNormalizesAndStopsDragging)
{
    state.SetMode(AppMode::AreaSelecting);
    state.BeginDrag({ 110, 60 });
    state.UpdateDrag({ 10, 10 });
    EXPECT_EQ(state.DragRect(), (ScreenRect{ 10, 10, 110, 60 }));

    ScreenRect r = state.FinishDrag();
    EXPECT_EQ(r, (ScreenRect{ 10, 10, 110, 60 }));
    EXPECT_FALSE(state.IsDragging());
}

TEST(AppModeTest, Names)
{
    EXPECT_STREQ(ToString(AppMode::Idle), "idle");
    EXPECT_STREQ(ToString(AppMode::AreaSelecting), "area-selecting");
    EXPECT_STREQ(ToString(AppMode::Capturing), "capturing");
    EXPECT_STREQ(ToString(AppMode::ExportingPdf), "exporting-pdf");
}

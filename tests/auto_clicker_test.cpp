#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "auto_clicker.h"
#include "fakes.h"

using namespace std::chrono_literals;

class AutoClickerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        clicker.SetEnabled(true);
        clicker.SetInterval(5ms);
    }

    FakeClickSink sink;
    AutoClicker   clicker{ sink };
};

TEST_F(AutoClickerTest, ClicksExactlyCountTimesThenNotifiesOnce)
{
    clicker.SetMaxCount(3);
    ASSERT_TRUE(clicker.Start({ 200, 300 }));
    ASSERT_TRUE(sink.WaitForCompletion());
    clicker.Stop();

    auto clicks = sink.Clicks();
    ASSERT_EQ(clicks.size(), 3u);
    for (const auto& pt : clicks) EXPECT_EQ(pt, (ScreenPoint{ 200, 300 }));
    EXPECT_EQ(clicker.Progress(), 3u);
    EXPECT_EQ(sink.Completions(), 1);
    EXPECT_FALSE(clicker.IsRunning());
    EXPECT_GE(sink.refreshRequests.load(), 2);
}

TEST_F(AutoClickerTest, ZeroCountClicksNothing)
{
    clicker.SetMaxCount(0);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));
    ASSERT_TRUE(sink.WaitForCompletion());
    clicker.Stop();
    EXPECT_TRUE(sink.Clicks().empty());
    EXPECT_EQ(sink.Completions(), 1);
}

TEST_F(AutoClickerTest, StartWhileRunningIsRejected)
{
    clicker.SetInterval(5s);
    clicker.SetMaxCount(10);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));
    EXPECT_TRUE(clicker.IsRunning());
    EXPECT_FALSE(clicker.Start({ 2, 2 }));
    clicker.Stop();
}

TEST_F(AutoClickerTest, StopDuringLongIntervalReturnsPromptly)
{
    clicker.SetInterval(5s);
    clicker.SetMaxCount(10);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));

    auto begin = std::chrono::steady_clock::now();
    clicker.Stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(sink.Clicks().empty());
    EXPECT_EQ(sink.Completions(), 1);
    EXPECT_FALSE(clicker.IsRunning());
}

TEST_F(AutoClickerTest, CancellationStopsFurtherClicks)
{
    clicker.SetInterval(20ms);
    clicker.SetMaxCount(500);
    ASSERT_TRUE(clicker.Start({ 7, 7 }));
    ASSERT_TRUE(sink.WaitForClicks(2));
    clicker.Stop();

    const size_t afterStop = sink.Clicks().size();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sink.Clicks().size(), afterStop);
    EXPECT_LT(afterStop, 500u);
    EXPECT_EQ(clicker.Progress(), afterStop);
}

TEST_F(AutoClickerTest, InjectionFailureEndsSession)
{
    sink.FailAfter(1);
    clicker.SetMaxCount(5);
    ASSERT_TRUE(clicker.Start({ 3, 3 }));
    ASSERT_TRUE(sink.WaitForCompletion());
    clicker.Stop();

    EXPECT_EQ(sink.Clicks().size(), 1u);
    EXPECT_EQ(clicker.Progress(), 1u);
    EXPECT_EQ(sink.Completions(), 1);
}

TEST_F(AutoClickerTest, CountAboveCeilingStopsAtCeiling)
{
    clicker.SetInterval(0ms);
    clicker.SetMaxCount(5000);
    ASSERT_TRUE(clicker.Start({ 4, 4 }));
    ASSERT_TRUE(sink.WaitForCompletion(30s));
    clicker.Stop();

    EXPECT_EQ(sink.Clicks().size(), AutoClicker::MAX_CLICK_COUNT);
    EXPECT_EQ(clicker.Progress(), AutoClicker::MAX_CLICK_COUNT);
}

// Collects warnings from the default logger for the lifetime of the object.
class WarningCapture {
public:
    WarningCapture()
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64))
        , previous_(spdlog::default_logger())
    {
        auto logger = std::make_shared<spdlog::logger>("auto_clicker_test", sink_);
        logger->set_level(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }
    ~WarningCapture() { spdlog::set_default_logger(previous_); }

    bool Contains(const std::string& text) const
    {
        auto lines = sink_->last_formatted();
        return std::any_of(lines.begin(), lines.end(),
                           [&](const std::string& l) { return l.find(text) != std::string::npos; });
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger>                    previous_;
};

TEST_F(AutoClickerTest, CountAtCeilingEndsOnTargetWithoutCeilingWarning)
{
    WarningCapture warnings;
    clicker.SetInterval(0ms);
    clicker.SetMaxCount(AutoClicker::MAX_CLICK_COUNT);
    ASSERT_TRUE(clicker.Start({ 4, 4 }));
    ASSERT_TRUE(sink.WaitForCompletion(30s));
    clicker.Stop();

    EXPECT_EQ(clicker.Progress(), AutoClicker::MAX_CLICK_COUNT);
    EXPECT_FALSE(warnings.Contains("safety ceiling"));
}

TEST_F(AutoClickerTest, CountAboveCeilingLogsCeilingWarning)
{
    WarningCapture warnings;
    clicker.SetInterval(0ms);
    clicker.SetMaxCount(AutoClicker::MAX_CLICK_COUNT + 1);
    ASSERT_TRUE(clicker.Start({ 4, 4 }));
    ASSERT_TRUE(sink.WaitForCompletion(30s));
    clicker.Stop();

    EXPECT_EQ(clicker.Progress(), AutoClicker::MAX_CLICK_COUNT);
    EXPECT_TRUE(warnings.Contains("safety ceiling"));
}

TEST_F(AutoClickerTest, RequestStopDoesNotJoinAndWorkerStillCompletes)
{
    clicker.SetInterval(5s);
    clicker.SetMaxCount(10);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));

    auto begin = std::chrono::steady_clock::now();
    clicker.RequestStop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(elapsed, 20ms);
    EXPECT_TRUE(clicker.IsRunning());

    ASSERT_TRUE(sink.WaitForCompletion());
    EXPECT_EQ(sink.Completions(), 1);
    clicker.Stop();
    EXPECT_FALSE(clicker.IsRunning());
    EXPECT_TRUE(sink.Clicks().empty());
    EXPECT_EQ(sink.Completions(), 1);
}

TEST_F(AutoClickerTest, RestartAfterCompletionResetsProgress)
{
    clicker.SetMaxCount(2);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));
    ASSERT_TRUE(sink.WaitForCompletion());
    clicker.Stop();
    EXPECT_EQ(clicker.Progress(), 2u);

    clicker.SetMaxCount(1);
    ASSERT_TRUE(clicker.Start({ 1, 1 }));
    ASSERT_TRUE(sink.WaitForClicks(3));
    clicker.Stop();
    EXPECT_EQ(clicker.Progress(), 1u);
}

#include "auto_clicker.h"

#include <algorithm>

#include <spdlog/spdlog.h>

AutoClicker::AutoClicker(AutoClickSink& sink)
    : sink_(sink)
{
}

AutoClicker::~AutoClicker()
{
    Stop();
}

bool AutoClicker::Start(ScreenPoint pt)
{
    if (running_) {
        spdlog::warn("auto-click: already running, start ignored");
        return false;
    }
    // A finished-but-unjoined worker from the previous session.
    if (worker_.joinable()) worker_.join();

    progress_.store(0);
    stopRequested_.store(false);
    running_ = true;
    worker_ = std::thread(&AutoClicker::WorkerProc, this, pt, interval_);

    spdlog::info("auto-click started at ({}, {}), interval {} ms, count {}",
                 pt.x, pt.y, interval_.count(), maxCount_.load());
    return true;
}

void AutoClicker::RequestStop()
{
    if (running_ && !stopRequested_.exchange(true))
        spdlog::info("auto-click stop requested after {} click(s)", progress_.load());
}

void AutoClicker::Stop()
{
    stopRequested_.store(true);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
    if (running_) {
        running_ = false;
        spdlog::info("auto-click stopped after {} click(s)", progress_.load());
    }
}

// Returns false when cancellation was observed during the sleep.
bool AutoClicker::SleepInterval(std::chrono::milliseconds interval)
{
    auto remaining = interval;
    while (remaining.count() > 0) {
        if (stopRequested_.load()) return false;
        auto chunk = std::min(remaining, SLEEP_CHUNK);
        std::this_thread::sleep_for(chunk);
        remaining -= chunk;
    }
    return !stopRequested_.load();
}

void AutoClicker::WorkerProc(ScreenPoint pt, std::chrono::milliseconds interval)
{
    while (true) {
        sink_.RequestOverlayRefresh();

        if (!SleepInterval(interval)) break;

        uint32_t current = progress_.load();
        if (current >= maxCount_.load()) break;
        // Only reachable when the requested count is above the ceiling.
        if (current >= MAX_CLICK_COUNT) {
            spdlog::warn("auto-click: reached the safety ceiling of {} clicks", MAX_CLICK_COUNT);
            break;
        }

        if (!sink_.InjectClick(pt)) {
            spdlog::error("auto-click: click injection failed at ({}, {}), ending session",
                          pt.x, pt.y);
            break;
        }
        progress_.store(current + 1);
        spdlog::debug("auto-click {}/{}", current + 1, maxCount_.load());
    }

    sink_.RequestOverlayRefresh();
    sink_.NotifyComplete();
}

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

#include "geometry.h"

/// Side effects of the auto-click worker.  Called from the worker thread, so
/// implementations must not touch UI state directly: post to the UI queue.
class AutoClickSink {
public:
    virtual ~AutoClickSink() = default;

    /// Synthesize one primary click at `pt`.  Returns false if injection failed.
    virtual bool InjectClick(ScreenPoint pt) = 0;
    /// Ask the UI thread to repaint the capture overlay.  Must not block.
    virtual void RequestOverlayRefresh() = 0;
    /// Posted exactly once per session, after the loop has exited.
    virtual void NotifyComplete() = 0;
};

/// Background click generator for one capture session.
///
/// Thread contract: Start/RequestStop/Stop/setters are UI-thread only.  The worker reads
/// stopRequested_, maxCount_ and writes progress_; nothing else is shared.
class AutoClicker {
public:
    static constexpr uint32_t MAX_CLICK_COUNT = 999;
    static constexpr std::chrono::milliseconds SLEEP_CHUNK{100};

    explicit AutoClicker(AutoClickSink& sink);
    ~AutoClicker();

    AutoClicker(const AutoClicker&) = delete;
    AutoClicker& operator=(const AutoClicker&) = delete;

    void SetEnabled(bool enabled) { enabled_ = enabled; }
    bool IsEnabled() const { return enabled_; }

    void SetInterval(std::chrono::milliseconds interval) { interval_ = interval; }
    std::chrono::milliseconds Interval() const { return interval_; }

    void SetMaxCount(uint32_t count) { maxCount_.store(count); }
    uint32_t MaxCount() const { return maxCount_.load(); }

    /// Spawn the worker clicking at `pt`.  Fails if a session is running.
    bool Start(ScreenPoint pt);

    /// Flag the worker to end without waiting for it.  Safe from the input
    /// hook callback; the worker still posts its one completion, and the
    /// session stays IsRunning() until Stop() reaps it.
    void RequestStop();

    /// Request cancellation and join.  No-op when nothing is running.
    void Stop();

    bool IsRunning() const { return running_; }
    uint32_t Progress() const { return progress_.load(); }

private:
    void WorkerProc(ScreenPoint pt, std::chrono::milliseconds interval);
    bool SleepInterval(std::chrono::milliseconds interval);

    AutoClickSink&            sink_;
    bool                      enabled_  = false;
    bool                      running_  = false;
    std::chrono::milliseconds interval_{1000};
    std::thread               worker_;
    std::atomic<bool>         stopRequested_{false};
    std::atomic<uint32_t>     progress_{0};
    std::atomic<uint32_t>     maxCount_{0};
};

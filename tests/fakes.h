#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "auto_clicker.h"
#include "mode_controller.h"
#include "overlay.h"

// ============================================================================
// Test doubles for the seams of the portable core
// ============================================================================

class FakeOverlay : public Overlay {
public:
    bool Show() override
    {
        ++showCount;
        if (!showResult) return false;
        visible = true;
        return true;
    }
    void Hide() override { ++hideCount; visible = false; }
    void Refresh() override { ++refreshCount; }
    void Reposition(ScreenPoint pt) override { lastPosition = pt; ++repositionCount; }
    bool IsVisible() const override { return visible; }

    bool        showResult = true;
    bool        visible    = false;
    int         showCount  = 0;
    int         hideCount  = 0;
    int         refreshCount    = 0;
    int         repositionCount = 0;
    ScreenPoint lastPosition;
};

class FakeHook : public InputHook {
public:
    bool Install() override
    {
        ++installCount;
        if (!installResult) return false;
        installed = true;
        return true;
    }
    void Uninstall() override
    {
        if (installed) ++uninstallCount;
        installed = false;
    }
    bool IsInstalled() const override { return installed; }

    bool installResult  = true;
    bool installed      = false;
    int  installCount   = 0;
    int  uninstallCount = 0;
};

struct Notice {
    NoticeLevel level;
    std::string title;
    std::string text;
};

class FakeHost : public HostWindow {
public:
    void Minimize() override { minimized = true; ++minimizeCount; }
    void Restore() override { minimized = false; ++restoreCount; }
    void RefreshControls() override { ++refreshCount; }
    void ShowNotice(NoticeLevel level, const std::string& title, const std::string& text) override
    {
        notices.push_back({ level, title, text });
    }
    bool Confirm(const std::string&, const std::string&) override
    {
        ++confirmCount;
        return confirmResult;
    }
    void SetBusy(bool b) override { busyHistory.push_back(b); }

    bool                minimized     = false;
    int                 minimizeCount = 0;
    int                 restoreCount  = 0;
    int                 refreshCount  = 0;
    int                 confirmCount  = 0;
    bool                confirmResult = true;
    std::vector<Notice> notices;
    std::vector<bool>   busyHistory;
};

/// Writes a small placeholder file instead of grabbing the screen.
class FakeCapturer : public RegionCapturer {
public:
    bool CaptureToJpeg(const ScreenRect& rect, int scalePercent, int jpegQuality,
                       const std::filesystem::path& target) override
    {
        rects.push_back(rect);
        targets.push_back(target);
        lastScale   = scalePercent;
        lastQuality = jpegQuality;
        if (!succeed) return false;
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (writeEmptyFile) return static_cast<bool>(out);
        out << "\xFF\xD8 fake jpeg";
        return static_cast<bool>(out);
    }

    bool                               succeed        = true;
    bool                               writeEmptyFile = false;
    int                                lastScale      = 0;
    int                                lastQuality    = 0;
    std::vector<ScreenRect>            rects;
    std::vector<std::filesystem::path> targets;
};

/// Auto-click sink that queues injected clicks for the test thread to pump
/// through the hook bridge, the way the OS would deliver them.
class FakeClickSink : public AutoClickSink {
public:
    bool InjectClick(ScreenPoint pt) override
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++attempts_;
        if (failAfter_ >= 0 && attempts_ > failAfter_) return false;
        clicks_.push_back(pt);
        pending_.push_back(pt);
        cv_.notify_all();
        return true;
    }

    void RequestOverlayRefresh() override { ++refreshRequests; }

    void NotifyComplete() override
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++completions_;
        cv_.notify_all();
    }

    /// Fail every injection after the first `n` successful ones.
    void FailAfter(int n)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        failAfter_ = n;
    }

    bool WaitForCompletion(std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, timeout, [this] { return completions_ > 0; });
    }

    /// Wait until at least `n` clicks have been injected.
    bool WaitForClicks(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, timeout, [this, n] { return clicks_.size() >= n; });
    }

    /// Pop one queued click; false when none is pending.
    bool TakePending(ScreenPoint& pt)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (pending_.empty()) return false;
        pt = pending_.front();
        pending_.pop_front();
        return true;
    }

    std::vector<ScreenPoint> Clicks() const
    {
        std::lock_guard<std::mutex> lk(mutex_);
        return clicks_;
    }

    int Completions() const
    {
        std::lock_guard<std::mutex> lk(mutex_);
        return completions_;
    }

    std::atomic<int> refreshRequests{0};

private:
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    std::vector<ScreenPoint> clicks_;
    std::deque<ScreenPoint>  pending_;
    int                      attempts_    = 0;
    int                      failAfter_   = -1;
    int                      completions_ = 0;
};

/// Unique directory under the system temp folder, removed on destruction.
class TempDir {
public:
    TempDir()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("click_capture_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

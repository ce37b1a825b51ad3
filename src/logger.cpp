#include "logger.h"

#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/msvc_sink.h>

#include "win_utils.h"

// Oldest lines are dropped if the dialog falls behind.
static const size_t LOG_QUEUE_LIMIT = 500;

// ============================================================================
// Dialog sink
// Formats each record on the logging thread, queues it and posts a message;
// the dialog drains the queue on the UI thread.  No window is touched here.
// ============================================================================
class DialogLogSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    void Attach(HWND hDlg, UINT msg)
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        hDlg_ = hDlg;
        msg_  = msg;
        if (!hDlg_) lines_.clear();
    }

    std::vector<std::wstring> Drain()
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        std::vector<std::wstring> out(lines_.begin(), lines_.end());
        lines_.clear();
        return out;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override
    {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        std::string line(formatted.data(), formatted.size());
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();

        HWND target = nullptr;
        UINT notify = 0;
        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            if (!hDlg_) return;
            lines_.push_back(U8toW(line));
            while (lines_.size() > LOG_QUEUE_LIMIT) lines_.pop_front();
            target = hDlg_;
            notify = msg_;
        }
        PostMessageW(target, notify, 0, 0);
    }

    void flush_() override {}

private:
    std::mutex               queueMutex_;
    std::deque<std::wstring> lines_;
    HWND                     hDlg_ = nullptr;
    UINT                     msg_  = 0;
};

static std::shared_ptr<DialogLogSink> g_dialogSink;

void InitLogger()
{
    // Log file lives next to the running executable.
    std::filesystem::path logPath = ExeDir() / L"click_capture.log";

    // spdlog filename_t is std::string unless SPDLOG_WCHAR_FILENAMES.
    std::string logPathA = WtoU8(logPath.wstring());

    try {
        auto fileSink  = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPathA, /*truncate=*/true);
        auto debugSink = std::make_shared<spdlog::sinks::msvc_sink_mt>();
        g_dialogSink   = std::make_shared<DialogLogSink>();
        g_dialogSink->set_pattern("[%H:%M:%S] %v");

        auto logger = std::make_shared<spdlog::logger>(
            "click_capture",
            spdlog::sinks_init_list{ fileSink, debugSink, g_dialogSink });

        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::info);
        spdlog::set_default_logger(logger);
        spdlog::cfg::load_env_levels();

        spdlog::info("click_capture logger started. Log file: {}", logPathA);
    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback: at least write to the debugger output.
        OutputDebugStringA("click_capture: failed to initialise spdlog file logger: ");
        OutputDebugStringA(ex.what());
        OutputDebugStringA("\n");
    }
}

void AttachLogWindow(HWND hDlg, UINT notifyMsg)
{
    if (g_dialogSink) g_dialogSink->Attach(hDlg, notifyMsg);
}

std::vector<std::wstring> DrainLogLines()
{
    if (!g_dialogSink) return {};
    return g_dialogSink->Drain();
}

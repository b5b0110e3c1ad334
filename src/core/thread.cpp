// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"
#include "core/logging.h"

#include <exception>
#include <utility>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <pthread.h>
#endif

namespace core {

// ---------------------------------------------------------------------------
// Thread naming -- platform-specific
// ---------------------------------------------------------------------------

void set_thread_name(std::string_view name)
{
#ifdef _WIN32
    if (name.empty()) return;

    int wide_len = MultiByteToWideChar(
        CP_UTF8, 0, name.data(), static_cast<int>(name.size()), nullptr, 0);
    if (wide_len <= 0) return;

    std::wstring wide_name(static_cast<size_t>(wide_len), L'\0');
    MultiByteToWideChar(
        CP_UTF8, 0, name.data(), static_cast<int>(name.size()),
        wide_name.data(), wide_len);

    ::SetThreadDescription(::GetCurrentThread(), wide_name.c_str());
#else
    // pthread_setname_np on Linux accepts at most 15 characters + NUL.
    constexpr size_t MAX_PTHREAD_NAME = 15;
    std::string truncated{name.substr(0, MAX_PTHREAD_NAME)};

#ifdef __APPLE__
    pthread_setname_np(truncated.c_str());
#else
    pthread_setname_np(pthread_self(), truncated.c_str());
#endif
#endif  // _WIN32
}

std::string get_thread_name()
{
#ifdef _WIN32
    PWSTR wide_name = nullptr;
    HRESULT hr = ::GetThreadDescription(::GetCurrentThread(), &wide_name);
    if (FAILED(hr) || wide_name == nullptr) return {};

    int utf8_len = WideCharToMultiByte(
        CP_UTF8, 0, wide_name, -1, nullptr, 0, nullptr, nullptr);
    if (utf8_len <= 0) {
        ::LocalFree(wide_name);
        return {};
    }

    std::string result(static_cast<size_t>(utf8_len - 1), '\0');
    WideCharToMultiByte(
        CP_UTF8, 0, wide_name, -1,
        result.data(), utf8_len, nullptr, nullptr);

    ::LocalFree(wide_name);
    return result;
#else
    char buf[64]{};
    if (pthread_getname_np(pthread_self(), buf, sizeof(buf)) != 0) return {};
    return std::string(buf);
#endif  // _WIN32
}

// ---------------------------------------------------------------------------
// TraceThread
// ---------------------------------------------------------------------------

TraceThread::TraceThread(std::string name, std::function<void()> func)
    : name_(std::move(name))
{
    thread_ = std::thread(
        [n = name_, f = std::move(func)]() {
            set_thread_name(n);
            LOG_DEBUG(LogCategory::THREAD, "thread '" + n + "' started");
            try {
                f();
            } catch (const std::exception& e) {
                LOG_ERROR(LogCategory::THREAD,
                          "exception in thread '" + n + "': " + e.what());
            } catch (...) {
                LOG_ERROR(LogCategory::THREAD,
                          "unknown exception in thread '" + n + "'");
            }
            LOG_DEBUG(LogCategory::THREAD, "thread '" + n + "' exiting");
        });
}

TraceThread::~TraceThread()
{
    // Destroyed from its own thread: the thread cannot join itself.
    if (thread_.joinable() &&
        thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return;
    }
    join();
}

TraceThread::TraceThread(TraceThread&& other) noexcept
    : name_(std::move(other.name_))
    , thread_(std::move(other.thread_))
{
}

TraceThread& TraceThread::operator=(TraceThread&& other) noexcept
{
    if (this != &other) {
        join();
        name_ = std::move(other.name_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

void TraceThread::join()
{
    if (thread_.joinable() &&
        thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool TraceThread::joinable() const noexcept
{
    return thread_.joinable();
}

}  // namespace core

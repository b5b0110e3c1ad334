#pragma once

// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace core {

// ---------------------------------------------------------------------------
// Thread naming
// ---------------------------------------------------------------------------

/// Set the name of the calling thread (visible in debuggers and OS tools).
/// On Windows uses SetThreadDescription; on POSIX uses pthread_setname_np.
void set_thread_name(std::string_view name);

/// Retrieve the name previously set for the calling thread.
/// Returns an empty string if no name was set or if the OS query fails.
std::string get_thread_name();

// ---------------------------------------------------------------------------
// TraceThread
// ---------------------------------------------------------------------------

/// RAII wrapper that starts a named thread with start/exit logging.
///
/// An exception escaping @p func is logged at ERROR level and the thread
/// exits normally instead of terminating the process.  A default-constructed
/// TraceThread owns no thread.  TraceThread is move-only; the destructor
/// joins the thread if joinable.
class TraceThread {
public:
    TraceThread() = default;

    /// Construct and immediately start the thread.
    /// @param name  Human-readable name for logging and OS-level thread name.
    /// @param func  Callable to execute on the new thread.
    TraceThread(std::string name, std::function<void()> func);

    ~TraceThread();

    TraceThread(TraceThread&& other) noexcept;
    TraceThread& operator=(TraceThread&& other) noexcept;

    TraceThread(const TraceThread&) = delete;
    TraceThread& operator=(const TraceThread&) = delete;

    /// Block until the thread completes.  Calling join() from the thread
    /// itself is a no-op.
    void join();

    bool joinable() const noexcept;

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::thread thread_;
};

}  // namespace core

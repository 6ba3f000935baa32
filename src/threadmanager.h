#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>
#include <memory>
#include <functional>
#include <string>

namespace sharebox {

/**
 * ThreadManager owns the background threads of a class and joins them on
 * shutdown. Threads that have already returned can be reaped while others
 * keep running, so long-lived servers do not accumulate finished handles.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a managed thread with a descriptive name
     * @param body Function run on the new thread
     * @param name Descriptive name for logging purposes
     * @return false if shutdown has been requested and no thread was started
     */
    bool add_managed_thread(std::function<void()> body, const std::string& name);

    /**
     * Join threads that have finished execution, leaving running ones alone
     * @return Number of threads reaped
     */
    size_t cleanup_finished_threads();

    /**
     * Refuse new threads from now on
     */
    void shutdown_all_threads();

    /**
     * Accept new threads again after a shutdown (used when restarting)
     */
    void reset_shutdown();

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    /**
     * Get the current number of threads not yet joined
     */
    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

private:
    struct ManagedThread {
        std::thread thread;
        std::string name;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    
    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    // Prevent copying
    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace sharebox

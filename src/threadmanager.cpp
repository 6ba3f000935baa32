#include "threadmanager.h"
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace sharebox {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
    LOG_THREAD_DEBUG("ThreadManager initialized");
}

ThreadManager::~ThreadManager() {
    // Ensure all threads are properly cleaned up
    join_all_active_threads();
    LOG_THREAD_DEBUG("ThreadManager destroyed");
}

bool ThreadManager::add_managed_thread(std::function<void()> body, const std::string& name) {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing to start thread during shutdown: " << name);
        return false;
    }
    
    ManagedThread managed;
    managed.name = name;
    managed.finished = std::make_shared<std::atomic<bool>>(false);
    
    std::shared_ptr<std::atomic<bool>> finished = managed.finished;
    managed.thread = std::thread([body, finished]() {
        body();
        finished->store(true);
    });
    
    active_threads_.push_back(std::move(managed));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

size_t ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;
    
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        auto it = active_threads_.begin();
        while (it != active_threads_.end()) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }
    
    for (auto& managed : finished_threads) {
        if (managed.thread.joinable()) {
            managed.thread.join();
        }
        LOG_THREAD_DEBUG("Reaped finished thread: " << managed.name);
    }
    
    return finished_threads.size();
}

void ThreadManager::shutdown_all_threads() {
    LOG_THREAD_INFO("Initiating shutdown of all background threads");
    shutdown_requested_.store(true);
}

void ThreadManager::reset_shutdown() {
    shutdown_requested_.store(false);
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;
    
    // Move threads out of the container while holding the lock
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            LOG_THREAD_DEBUG("No active threads to join");
            return;
        }
        
        LOG_THREAD_INFO("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }
    
    // Join threads without holding the mutex
    for (auto& managed : threads_to_join) {
        if (managed.thread.joinable()) {
            try {
                managed.thread.join();
            } catch (const std::system_error& e) {
                LOG_THREAD_ERROR("Failed to join thread " << managed.name << ": " << e.what());
            }
        }
    }
    
    LOG_THREAD_INFO("All managed threads have been cleaned up");
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

} // namespace sharebox

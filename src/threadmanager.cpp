#include "threadmanager.h"
#include "logger.h"
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace xtrans {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    shutdown_all_threads();
    join_all_active_threads();
}

void ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    if (shutdown_requested_.load()) {
        // Too late to track it; the thread sees the shutdown flag and exits on its own
        LOG_THREAD_WARN("Shutdown in progress, joining new thread immediately: " << name);
        if (t.joinable()) {
            t.join();
        }
        return;
    }

    active_threads_.emplace_back(std::move(t));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
}

void ThreadManager::shutdown_all_threads() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        shutdown_requested_.store(true);
    }
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<std::thread> threads_to_join;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    LOG_THREAD_DEBUG("Waiting for " << threads_to_join.size() << " managed threads to finish");

    for (auto& t : threads_to_join) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            // Owner is being torn down from one of its own threads
            t.detach();
            continue;
        }
        try {
            t.join();
        } catch (const std::system_error& e) {
            LOG_THREAD_ERROR("Exception while joining thread: " << e.what());
            t.detach();
        }
    }
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

bool ThreadManager::wait_for_shutdown(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    return shutdown_cv_.wait_for(lock, duration, [this] { return shutdown_requested_.load(); });
}

void ThreadManager::notify_shutdown() {
    shutdown_cv_.notify_all();
}

} // namespace xtrans

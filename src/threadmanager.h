#pragma once

#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <string>

namespace xtrans {

/**
 * ThreadManager owns the background threads of a class (handshake resends,
 * signal dispatch) and coordinates their shutdown.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Add a managed thread with a descriptive name
     * @param t Thread to be managed (moved)
     * @param name Descriptive name for logging purposes
     */
    void add_managed_thread(std::thread&& t, const std::string& name);

    /**
     * Signal all threads to shutdown and wake any waiting thread
     */
    void shutdown_all_threads();

    /**
     * Join all active threads. A thread asking to join itself is detached instead.
     */
    void join_all_active_threads();

    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Sleep for the given duration unless shutdown is requested first.
     * @return true if shutdown was requested
     */
    bool wait_for_shutdown(std::chrono::milliseconds duration);

    void notify_shutdown();

    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;

private:
    std::vector<std::thread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace xtrans

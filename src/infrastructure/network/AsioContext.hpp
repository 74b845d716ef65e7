#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace connmon::infra {

/**
 * @brief Bounded worker pool around an asio::io_context.
 *
 * Every coordinator timer, probe and DNS lookup runs on these threads, so the
 * pool size bounds how many blocking network operations can be in flight.
 * The work guard keeps the threads alive while no timer is pending.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs a pool with the specified number of worker threads.
     * @param threadCount Number of worker threads, at least one is used.
     */
    explicit AsioContext(size_t threadCount = 4);

    /**
     * @brief Destructor. Stops the pool and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the io_context and joins the worker threads.
     *
     * Pending handlers are discarded; the context is restarted so it can be
     * started again.
     */
    void stop();

    asio::io_context& getContext() { return ioContext_; }

    bool isRunning() const { return running_.load(); }

    size_t threadCount() const { return threadCount_; }

    /**
     * @brief Posts a handler to the worker pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace connmon::infra

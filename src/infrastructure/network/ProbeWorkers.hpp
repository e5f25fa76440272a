#pragma once

#include "core/Logging.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace uptimegrid::infra {

/**
 * @brief Worker threads for blocking checks during one probe phase.
 *
 * Checks that block on sockets (ICMP receive loops, name resolution) run here
 * so the caller can wait on their futures with a deadline. The pool lives for
 * one probe phase: finish() waits for the work still in flight, which the
 * socket timeouts bound, and releases the threads.
 */
class ProbeWorkers {
public:
    ProbeWorkers(std::size_t threadCount, core::LoggerPtr logger);
    ~ProbeWorkers();

    ProbeWorkers(const ProbeWorkers&) = delete;
    ProbeWorkers& operator=(const ProbeWorkers&) = delete;

    /**
     * @brief Runs @p task on a worker thread.
     * @return Future holding the task's result, or the exception it threw.
     * @throws std::logic_error after finish().
     */
    template <typename Task>
    std::future<std::invoke_result_t<Task&>> submit(Task task) {
        using Result = std::invoke_result_t<Task&>;
        if (finished_) {
            throw std::logic_error("Probe workers already finished");
        }
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
        auto future = packaged->get_future();
        asio::post(pool_, [packaged]() { (*packaged)(); });
        return future;
    }

    /**
     * @brief Waits for submitted work and joins the threads. Idempotent.
     */
    void finish();

    [[nodiscard]] std::size_t threadCount() const { return threadCount_; }

private:
    std::size_t threadCount_;
    asio::thread_pool pool_;
    std::atomic<bool> finished_{false};
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

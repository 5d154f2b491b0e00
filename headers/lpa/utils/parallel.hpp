//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_PARALLEL_HPP
#define LPA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Fans per-file analysis out over worker threads.
 */

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace lpa::parallel {

    /**
     * Returns the number of hardware threads available, or 1 if detection fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Number of workers to start for `jobs` jobs. A request of 0 means one
     * per hardware thread; there is never more than one worker per job.
     */
    inline unsigned int worker_count(const unsigned int requested, const std::size_t jobs) noexcept {
        const unsigned int wanted = requested == 0 ? hardware_concurrency() : requested;
        return static_cast<unsigned int>(std::min<std::size_t>(wanted, jobs));
    }

    /**
     * Applies f to every item and returns the results index-aligned with
     * items. Workers claim the next unprocessed index from a shared
     * counter, so one slow file does not hold back a whole batch.
     *
     * f runs concurrently and must not mutate shared state. The first
     * exception thrown by f stops the remaining work and is rethrown once
     * every worker has finished.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, const unsigned int threads)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<ResultType> results(items.size());
        const unsigned int workers = worker_count(threads, items.size());
        if (workers <= 1) {
            for (std::size_t i = 0; i < items.size(); ++i) {
                results[i] = f(items[i]);
            }
            return results;
        }

        std::atomic<std::size_t> next{0};
        std::mutex failure_mutex;
        std::exception_ptr failure;

        const auto work = [&] {
            for (std::size_t i = next++; i < items.size(); i = next++) {
                try {
                    results[i] = f(items[i]);
                } catch (...) {
                    const std::lock_guard lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    next = items.size();
                    return;
                }
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned int w = 0; w < workers; ++w) {
            pool.emplace_back(work);
        }
        for (auto& worker : pool) {
            worker.join();
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
        return results;
    }

}  // namespace lpa::parallel

#endif //LPA_PARALLEL_HPP

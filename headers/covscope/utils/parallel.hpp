//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_PARALLEL_HPP
#define COVSCOPE_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Fan-out/fan-in over a batch of independent items.
 *
 * Used to parse report files concurrently. Workers live only for the
 * duration of one map() call; there is no process-wide pool.
 */

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

namespace covscope::parallel {

    /**
     * Returns the number of hardware threads, or 1 if it cannot be detected.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Picks a worker count for a batch.
     *
     * @param requested Requested threads (0 = hardware concurrency).
     * @param task_count Number of items; no more workers than items are used.
     * @return A value in [1, max(requested or hw, 1)].
     */
    inline unsigned int worker_count(const std::size_t requested, const std::size_t task_count) noexcept {
        std::size_t n = requested == 0 ? hardware_concurrency() : requested;
        n = std::min(n, std::max<std::size_t>(task_count, 1));
        return static_cast<unsigned int>(n);
    }

    /**
     * Applies `f` to every item using `workers` threads, the calling thread
     * being one of them. Each worker claims the next unprocessed index, so
     * every item is handled exactly once.
     *
     * Results are returned in input order. The call returns only after every
     * item has been processed; if any call to `f` threw, the exception of the
     * lowest-indexed failing item is rethrown at that point.
     *
     * @param f Must be safe to call concurrently.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, const unsigned int workers)
        -> std::vector<std::invoke_result_t<F&, const T&>> {
        using R = std::invoke_result_t<F&, const T&>;

        std::vector<std::optional<R>> slots(items.size());
        std::vector<std::exception_ptr> failures(items.size());
        std::atomic<std::size_t> next{0};

        auto drain = [&] {
            for (std::size_t i = next++; i < items.size(); i = next++) {
                try {
                    slots[i].emplace(f(items[i]));
                } catch (...) {
                    failures[i] = std::current_exception();
                }
            }
        };

        std::vector<std::thread> threads;
        const unsigned int extra = std::max(workers, 1u) - 1;
        threads.reserve(extra);
        try {
            for (unsigned int i = 0; i < extra; ++i) {
                threads.emplace_back(drain);
            }
        } catch (const std::system_error&) {
            // Fewer threads than requested; the started ones and this thread finish the batch.
        }

        drain();
        for (auto& thread : threads) {
            thread.join();
        }

        for (const auto& failure : failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        std::vector<R> results;
        results.reserve(items.size());
        for (auto& slot : slots) {
            results.push_back(std::move(*slot));
        }
        return results;
    }

}  // namespace covscope::parallel

#endif //COVSCOPE_PARALLEL_HPP

#pragma once

#include "logging/logger.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace podium {

/**
 * @brief Fixed-size pool for a parallel map over a read-only input list.
 *
 * Each thread builds its own state once (FFT plans, scratch buffers) and then claims
 * inputs through a shared atomic index. Results are stored by input index, so completion
 * order never changes the output order.
 *
 * Fail-fast: the first exception stops further dispatch and is rethrown from map()
 * after all threads have joined. No partial results are returned.
 */
class WorkerPool {
   public:
    // 0 = hardware concurrency
    explicit WorkerPool(int numThreads = 0) {
        unsigned hw = std::thread::hardware_concurrency();
        threadCount_ = numThreads > 0 ? static_cast<std::size_t>(numThreads)
                                      : static_cast<std::size_t>(hw > 0 ? hw : 1);
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::size_t threadCount() const {
        return threadCount_;
    }

    /**
     * @param makeState Called once per thread; returns the per-thread state
     * @param fn Called as fn(state, input, index); must return Output
     */
    template <typename Output, typename Input, typename MakeState, typename Fn>
    std::vector<Output> map(const std::vector<Input>& inputs, MakeState makeState, Fn fn) {
        std::vector<Output> outputs(inputs.size());
        if (inputs.empty()) {
            return outputs;
        }

        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        auto recordError = [&](std::exception_ptr error) {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (!firstError) {
                firstError = error;
            }
            failed.store(true, std::memory_order_release);
        };

        auto worker = [&]() {
            try {
                auto state = makeState();
                while (!failed.load(std::memory_order_acquire)) {
                    std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
                    if (index >= inputs.size()) {
                        break;
                    }
                    outputs[index] = fn(state, inputs[index], index);
                }
            } catch (...) {
                recordError(std::current_exception());
            }
        };

        const std::size_t threads = std::min(threadCount_, inputs.size());
        LOG_DEBUG("WorkerPool: {} items on {} threads", inputs.size(), threads);

        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }
        return outputs;
    }

   private:
    std::size_t threadCount_;
};

}  // namespace podium

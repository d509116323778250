#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// WorkerPool — runs task(i) for i in [0, count) on a fixed number of threads
//
// Workers pull indices from a shared atomic cursor. Callers write results
// into pre-sized slots indexed by i, so output does not depend on the number
// of workers or on scheduling. should_stop() is polled before each index is
// taken; once it returns true no further indices are handed out.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(size_t num_workers = 0) {
        if (num_workers == 0) num_workers = std::thread::hardware_concurrency();
        num_workers_ = std::max<size_t>(1, num_workers);
    }

    size_t size() const { return num_workers_; }

    template <typename Task, typename StopPredicate>
    void for_each_index(size_t count, Task&& task, StopPredicate&& should_stop) const {
        if (count == 0) return;

        std::atomic<size_t> cursor{0};
        std::atomic<bool> halted{false};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto work = [&]() {
            while (!halted.load()) {
                if (should_stop()) {
                    halted.store(true);
                    break;
                }
                size_t i = cursor.fetch_add(1);
                if (i >= count) break;
                try {
                    task(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    halted.store(true);
                }
            }
        };

        size_t n_threads = std::min(num_workers_, count);
        if (n_threads == 1) {
            work();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(n_threads);
            for (size_t t = 0; t < n_threads; ++t) threads.emplace_back(work);
            for (auto& th : threads) th.join();
        }

        if (first_error) std::rethrow_exception(first_error);
    }

private:
    size_t num_workers_ = 1;
};

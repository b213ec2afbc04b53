#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace qrbackup::parallel {

// Runs fn(i) for i in [0, count) on up to `workers` threads. The first exception
// thrown stops further items from being started and is rethrown here, after every
// started thread has been joined. When the system refuses a thread the work
// continues on the threads already started.
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t workers, Fn&& fn) {
    workers = std::min(std::max<std::size_t>(1, workers), std::max<std::size_t>(1, count));
    if (count == 0 || workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;
    auto worker = [&]() {
        while (!failed.load()) {
            std::size_t idx = next.fetch_add(1);
            if (idx >= count) {
                break;
            }
            try {
                fn(idx);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
    };
    std::vector<std::thread> threads;
    threads.reserve(workers);
    auto join_all = [&threads]() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    };
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // Out of threads: finish on the ones already running.
        if (threads.empty()) {
            throw;
        }
    }
    join_all();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace qrbackup::parallel

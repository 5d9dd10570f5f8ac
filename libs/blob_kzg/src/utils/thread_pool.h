/*
 * Blob KZG
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <mutex>
#include <semaphore>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// =======================================
// ============= THREAD POOL =============
// =======================================

// At most size() submitted tasks run at once, each on its own
// std::async thread. The destructor waits for every submitted task.
class ThreadPool {
public:
    explicit ThreadPool(size_t workers = std::thread::hardware_concurrency())
        : workers_(workers == 0 ? 1 : workers),
          slots_(static_cast<std::ptrdiff_t>(workers_)) {}

    ~ThreadPool() {
        std::unique_lock<std::mutex> lock(mu_);
        idle_.wait(lock, [this]() { return pending_ == 0; });
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_; }

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        {
            std::lock_guard<std::mutex> lock(mu_);
            pending_++;
        }

        try {
            return std::async(std::launch::async, [this, fn = std::forward<Fn>(fn)]() mutable {
                slots_.acquire();
                Slot held(*this);
                return fn();
            });
        } catch (const std::system_error &) {
            finish();
            throw;
        }
    }

private:
    // gives the slot back even when the task throws
    struct Slot {
        ThreadPool &tp;
        explicit Slot(ThreadPool &p) : tp(p) {}
        ~Slot() {
            tp.slots_.release();
            tp.finish();
        }
    };

    void finish() {
        std::lock_guard<std::mutex> lock(mu_);
        pending_--;
        idle_.notify_all();
    }

    size_t workers_;
    std::counting_semaphore<> slots_;
    std::mutex mu_;
    std::condition_variable idle_;
    size_t pending_ = 0;
};

// =======================================
// ============= PARTITIONING ============
// =======================================

// Splits [0, n) into one contiguous range per worker and runs
// body(lo, hi) on each. Results come back in range order.
// A null pool runs a single range on the calling thread.
// Must not be called from inside a pool task.
template <typename Fn>
auto map_chunks(ThreadPool* tp, size_t n, Fn body)
    -> std::vector<std::invoke_result_t<Fn, size_t, size_t>>
{
    using R = std::invoke_result_t<Fn, size_t, size_t>;
    std::vector<R> out;

    if (tp == nullptr || tp->size() < 2 || n < 2) {
        out.push_back(body(0, n));
        return out;
    }

    size_t chunks = std::min(tp->size(), n);
    size_t step = (n + chunks - 1) / chunks;

    std::vector<std::future<R>> futures;
    futures.reserve(chunks);
    for (size_t lo = 0; lo < n; lo += step) {
        size_t hi = std::min(lo + step, n);
        futures.push_back(tp->submit([&body, lo, hi]() { return body(lo, hi); }));
    }

    // every task borrows `body`, so all must finish before any rethrow
    for (auto &f : futures) f.wait();

    out.reserve(futures.size());
    for (auto &f : futures) out.push_back(f.get());
    return out;
}

// First non-ok status in range order, or ok.
template <typename S>
S first_error(const std::vector<S> &statuses, S ok) {
    for (const S &s : statuses) {
        if (s != ok) return s;
    }
    return ok;
}

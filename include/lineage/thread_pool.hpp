/**
 * Work-stealing thread pool used for corpus indexing and per-target resolution.
 *
 * Each worker owns a deque; it pops its own work LIFO and steals from the
 * others FIFO when idle. Tasks submitted from outside the pool are spread
 * round-robin across the worker deques.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace lineage {

/**
 * Mutex-guarded deque: owner works the bottom, thieves take from the top
 */
class WorkStealingDeque {
public:
    using Task = std::function<void()>;

    void push_bottom(Task task) {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }

    std::optional<Task> pop_bottom() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return std::nullopt;
        Task task = std::move(tasks_.back());
        tasks_.pop_back();
        return task;
    }

    std::optional<Task> steal() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return std::nullopt;
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        return task;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.empty();
    }

private:
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
};

class ThreadPool {
public:
    using Task = std::function<void()>;

    // 0 threads means hardware concurrency
    explicit ThreadPool(size_t num_threads = 0) : num_threads_(num_threads), stop_(false) {
        if (num_threads_ == 0) {
            num_threads_ = std::thread::hardware_concurrency();
        }
        num_threads_ = std::max(size_t(1), num_threads_);
        workers_.reserve(num_threads_);
        deques_.reserve(num_threads_);

        for (size_t i = 0; i < num_threads_; ++i) {
            deques_.push_back(std::make_unique<WorkStealingDeque>());
        }

        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this, i);
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            stop_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();
        auto wrapped_task = [task]() { (*task)(); };

        // Workers keep their own spawned work local, outside callers round-robin
        size_t target;
        if (current_pool_ == this) {
            target = current_thread_id_;
        } else {
            target = next_queue_.fetch_add(1, std::memory_order_relaxed) % num_threads_;
        }
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            ++pending_;
        }
        deques_[target]->push_bottom(std::move(wrapped_task));
        wake_.notify_one();
        return result;
    }

    // Runs func(i) for i in [begin, end) and rethrows the first task exception
    template<typename Func>
    void parallel_for(size_t begin, size_t end, Func&& func) {
        if (begin >= end) return;

        const size_t total = end - begin;
        const size_t chunk_size = std::max(size_t(1), total / (num_threads_ * 8));

        std::vector<std::future<void>> futures;
        futures.reserve(total / chunk_size + 1);

        for (size_t i = begin; i < end; i += chunk_size) {
            size_t chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([&func, i, chunk_end]() {
                for (size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        // Wait for every chunk before surfacing a failure
        std::exception_ptr first_error;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    size_t num_threads() const { return num_threads_; }

private:
    void worker_loop(size_t thread_id) {
        current_pool_ = this;
        current_thread_id_ = thread_id;

        while (true) {
            std::optional<Task> task = deques_[thread_id]->pop_bottom();

            if (!task) {
                for (size_t attempt = 1; attempt < num_threads_ && !task; ++attempt) {
                    size_t victim = (thread_id + attempt) % num_threads_;
                    task = deques_[victim]->steal();
                }
            }

            if (task) {
                {
                    std::lock_guard<std::mutex> lock(wake_mutex_);
                    --pending_;
                }
                (*task)();
                continue;
            }

            std::unique_lock<std::mutex> lock(wake_mutex_);
            if (stop_ && pending_ == 0) {
                break;
            }
            wake_.wait(lock, [this]() { return stop_ || pending_ > 0; });
            if (stop_ && pending_ == 0) {
                break;
            }
        }

        current_pool_ = nullptr;
    }

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::vector<std::unique_ptr<WorkStealingDeque>> deques_;
    std::atomic<size_t> next_queue_{0};

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    size_t pending_ = 0;
    bool stop_;

    static inline thread_local const ThreadPool* current_pool_ = nullptr;
    static inline thread_local size_t current_thread_id_ = 0;
};

} // namespace lineage

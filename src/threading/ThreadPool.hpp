#pragma once

// ============================================================================
// ThreadPool: fixed set of workers draining one FIFO of tasks
// ============================================================================
//
//   submit(task) ──> queue ──> worker 0..N-1
//        │
//        └── returns std::future<R>; an exception thrown by the task is
//            stored in the future and rethrown by future.get()
//
// Workers are started in the constructor and joined in the destructor.
// The destructor drains whatever is still queued before joining, so a
// future obtained from submit() is always eventually satisfied.
//
// Tasks may be move-only (a lambda that owns a partition buffer). The
// packaged_task lives behind a shared_ptr so the type-erased queue entry
// stays copyable for std::function.
// ============================================================================

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace AisLake
{

    class ThreadPool
    {
    public:
        explicit ThreadPool(size_t num_threads)
        {
            if (num_threads == 0)
                throw std::invalid_argument("[ThreadPool] needs at least one worker");

            workers_.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
                workers_.emplace_back(&ThreadPool::worker_loop, this);
        }

        ~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopping_ = true;
            }
            task_cv_.notify_all();
            for (auto &worker : workers_)
            {
                if (worker.joinable())
                    worker.join();
            }
        }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;
        ThreadPool(ThreadPool &&) = delete;
        ThreadPool &operator=(ThreadPool &&) = delete;

        template <typename F>
        auto submit(F &&fn) -> std::future<std::invoke_result_t<std::decay_t<F> &>>
        {
            using Result = std::invoke_result_t<std::decay_t<F> &>;

            auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
            std::future<Result> future = task->get_future();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_)
                    throw std::runtime_error("[ThreadPool] submit() after shutdown");
                queue_.push([task]
                            { (*task)(); });
                ++outstanding_;
            }
            task_cv_.notify_one();
            return future;
        }

        // Blocks until the queue is empty and no worker is mid-task.
        void wait_idle()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            idle_cv_.wait(lock, [this]
                          { return outstanding_ == 0; });
        }

        size_t thread_count() const { return workers_.size(); }

    private:
        void worker_loop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    task_cv_.wait(lock, [this]
                                  { return stopping_ || !queue_.empty(); });
                    if (queue_.empty())
                        return; // stopping and drained
                    task = std::move(queue_.front());
                    queue_.pop();
                }

                // packaged_task captures the task's exception; nothing escapes here.
                task();

                bool idle = false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    idle = (--outstanding_ == 0);
                }
                if (idle)
                    idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> queue_;
        std::mutex mutex_;
        std::condition_variable task_cv_;
        std::condition_variable idle_cv_;
        size_t outstanding_ = 0; // queued + running, guarded by mutex_
        bool stopping_ = false;
    };

} // namespace AisLake

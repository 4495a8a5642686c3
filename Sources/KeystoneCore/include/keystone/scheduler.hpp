#pragma once

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace keystone {

// ============================================================================
// scheduler - where the *_async operations of a context run
// ============================================================================

class scheduler {
public:
    virtual ~scheduler() = default;

    /// Queues work. Safe to call from any thread, including a worker.
    virtual void post(std::function<void()> work) = 0;
};

// ============================================================================
// thread_pool_scheduler - fixed set of workers over a FIFO queue
// ============================================================================
//
// Destruction stops accepting work, lets the workers drain what is already
// queued, then joins them.

class thread_pool_scheduler : public scheduler {
public:
    explicit thread_pool_scheduler(size_t worker_count) {
        worker_count = std::max<size_t>(worker_count, 1);
        workers_.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            workers_.emplace_back([this] { work_loop(); });
        }
    }

    ~thread_pool_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    thread_pool_scheduler(const thread_pool_scheduler&) = delete;
    thread_pool_scheduler& operator=(const thread_pool_scheduler&) = delete;

    void post(std::function<void()> work) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                // Dropping the job breaks its promise; the caller's future reports it
                return;
            }
            pending_.push_back(std::move(work));
        }
        wake_.notify_one();
    }

private:
    void work_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (pending_.empty()) {
                return;
            }
            auto work = std::move(pending_.front());
            pending_.pop_front();

            lock.unlock();
            work();
            // Captured state is released outside the lock too
            work = nullptr;
            lock.lock();
        }
    }

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> pending_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

// ============================================================================
// immediate_scheduler - runs work on the posting thread before returning
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void post(std::function<void()> work) override { work(); }
};

// Runs fn on sched; the future carries its result or exception. hold is
// released as soon as fn has run, or when sched drops the job unrun. The
// future shares fn's state and may keep it far longer.
template<typename Fn>
auto submit(scheduler& sched, Fn&& fn, std::shared_ptr<void> hold = nullptr)
    -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using result_t = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<result_t()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    sched.post([task, hold]() mutable {
        (*task)();
        hold.reset();
    });
    return future;
}

} // namespace keystone

#pragma once
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

// Fixed-size worker pool. The HTTP server hands each accepted connection to
// it, so the pool size is the number of requests served at once.
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = 1) : stop(false) {
        if (numThreads == 0) numThreads = 1;
        for(size_t i = 0; i < numThreads; ++i) {
            workers.emplace_back([this] {
                for(;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(this->queue_mutex);
                        this->condition.wait(lock, [this]{ return this->stop || !this->tasks.empty(); });
                        if(this->stop && this->tasks.empty()) return;
                        task = std::move(this->tasks.front());
                        this->tasks.pop();
                        ++this->running;
                    }
                    task();
                    {
                        std::unique_lock<std::mutex> lock(this->queue_mutex);
                        --this->running;
                    }
                    this->idle.notify_all();
                }
            });
        }
    }

    // Drains the queue before joining.
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for(std::thread &worker: workers)
            worker.join();
    }

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<typename std::result_of<F(Args...)>::type> {
        using return_type = typename std::result_of<F(Args...)>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if(stop) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks.emplace([task](){ (*task)(); });
        }
        condition.notify_one();
        return res;
    }

    // Blocks until the queue is empty and no task is running.
    void wait_idle() {
        std::unique_lock<std::mutex> lock(queue_mutex);
        idle.wait(lock, [this]{ return tasks.empty() && running == 0; });
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex);
        return tasks.size();
    }

    size_t active() const {
        std::unique_lock<std::mutex> lock(queue_mutex);
        return running;
    }

    size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle;
    size_t running{0};
    std::atomic<bool> stop;
};

#pragma once
#include <atomic>
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

namespace Relink {

// Fixed-size worker pool for the parallel phases of a relinking pass
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task for execution
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (stop.load()) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            tasks.push([task]() { (*task)(); });
            pending_tasks.fetch_add(1);
        }

        condition.notify_one();
        return result;
    }

    // Block until every submitted task has finished
    void wait_all();

    size_t get_thread_count() const { return workers.size(); }
    size_t get_completed_tasks() const { return completed_tasks.load(); }

    // Finish queued tasks and join the workers
    void shutdown();

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;
    std::atomic<bool> stop{false};
    std::atomic<size_t> pending_tasks{0};
    std::atomic<size_t> completed_tasks{0};

    void worker_thread();
};

} // namespace Relink

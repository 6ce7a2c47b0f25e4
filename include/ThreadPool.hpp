#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <algorithm>
#include <cstddef>
#include <utility>

namespace PTAX {

/**
 * @brief Simple thread pool for independent per-member work
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency()) {
        num_threads = std::max<size_t>(num_threads, 1);
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex);
                        condition.wait(lock, [this] {
                            return stop || !tasks.empty();
                        });
                        if (stop && tasks.empty()) return;
                        task = std::move(tasks.front());
                        tasks.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for (auto& worker : workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace(std::forward<F>(f));
        }
        condition.notify_one();
    }

    /**
     * @brief Run body(chunk_start, chunk_end) over [start, end) and wait
     *
     * The body must not throw; each chunk must only write its own slots.
     */
    void parallelFor(size_t start, size_t end,
                     const std::function<void(size_t, size_t)>& body) {
        if (end <= start) return;

        size_t n_threads = workers.size();
        size_t chunk = (end - start + n_threads - 1) / n_threads;

        std::mutex done_mutex;
        std::condition_variable done;
        size_t pending = 0;

        for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk) {
            size_t chunk_end = std::min(chunk_start + chunk, end);
            {
                std::lock_guard<std::mutex> lock(done_mutex);
                ++pending;
            }
            enqueue([&, chunk_start, chunk_end] {
                body(chunk_start, chunk_end);
                std::lock_guard<std::mutex> lock(done_mutex);
                if (--pending == 0) {
                    done.notify_one();
                }
            });
        }

        std::unique_lock<std::mutex> lock(done_mutex);
        done.wait(lock, [&pending] { return pending == 0; });
    }

    size_t numThreads() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop = false;
};

} // namespace PTAX

#endif // THREAD_POOL_HPP

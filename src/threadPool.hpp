#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

// Fixed set of workers, one connection per task. A task that throws is logged
// and dropped; the worker keeps running.
class ThreadPool{
    public:
        explicit ThreadPool(size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // false once shutdown() has started; the task is not run.
        template<class F>
        bool enqueue(F&& task){
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                if(stop){
                    return false;
                }
                tasks.emplace(std::forward<F>(task));
            }
            condition.notify_one();
            return true;
        }

        // Runs what is already queued, then joins the workers. Idempotent.
        void shutdown();

        size_t size() const { return workers.size(); }

    private:
        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;

        std::mutex queueMutex;
        std::condition_variable condition;
        bool stop;

        void workerLoop();
};

#endif // THREADPOOL_HPP

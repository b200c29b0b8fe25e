#include "threadPool.hpp"
#include "logger.hpp"
#include <exception>

ThreadPool::ThreadPool(size_t threadCount) : stop(false){
    for(size_t i = 0; i < threadCount; ++i){
        workers.emplace_back([this]{ workerLoop(); });
    }
}

void ThreadPool::workerLoop(){
    for(;;){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]{ return stop || !tasks.empty(); });
            if(stop && tasks.empty()){
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        try{
            task();
        } catch (const std::exception &e) {
            Logger::getInstance().logError(NO_REQUEST, std::string("worker task failed: ") + e.what());
        }
    }
}

void ThreadPool::shutdown(){
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        stop = true;
    }
    condition.notify_all();
    for(auto &worker: workers){
       if(worker.joinable()){
           worker.join();
       }
    }
}

ThreadPool::~ThreadPool(){
    shutdown();
}

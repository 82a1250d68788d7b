#include "background_tasks.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <string>

BackgroundTasks::~BackgroundTasks(){
    size_t drained = wait_all();
    if(drained > 0){
        log_debug("tasks", "drained " + std::to_string(drained) + " background task(s) on shutdown");
    }
}

std::function<void(std::future<void>)> BackgroundTasks::hook(){
    return [this](std::future<void> task) {
        track(std::move(task));
    };
}

void BackgroundTasks::track(std::future<void> task){
    if(!task.valid()){
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    // Forget finished work so a long-running process does not accumulate futures
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::future<void>& f) {
                                    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                }),
                 tasks_.end());
    tasks_.push_back(std::move(task));
}

size_t BackgroundTasks::wait_all(){
    size_t waited = 0;
    while(true){
        std::vector<std::future<void>> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(tasks_);
        }
        if(batch.empty()){
            return waited;
        }
        for(auto& task : batch){
            try {
                task.get();
            } catch (const std::exception& e) {
                log_error("tasks", std::string("background task failed: ") + e.what());
            } catch (...) {
                log_error("tasks", "background task failed: unknown exception");
            }
            ++waited;
        }
    }
}

size_t BackgroundTasks::pending() const{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                             [](const std::future<void>& f) {
                                                 return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
                                             }));
}

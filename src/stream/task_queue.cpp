#include "task_queue.h"

namespace tefp {

Task::Task(std::string reference) : reference_(std::move(reference)) {}

TaskQueue::TaskQueue(int num_workers) {
    if (num_workers < 1) num_workers = 1;
    for (int i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&TaskQueue::worker_loop, this);
    }
}

TaskQueue::~TaskQueue() {
    close();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

bool TaskQueue::submit(std::unique_ptr<Task> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) return false;
    queue_.push(std::move(task));
    ++pending_;
    cv_.notify_one();
    return true;
}

void TaskQueue::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

void TaskQueue::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_done_.wait(lock, [this]() {
        return pending_ == 0;
    });
}

size_t TaskQueue::size() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::worker_loop() {
    while (true) {
        std::unique_ptr<Task> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return closed_ || !queue_.empty();
            });

            if (queue_.empty()) return;

            task = std::move(queue_.front());
            queue_.pop();
        }

        task->execute();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            --pending_;
            if (pending_ == 0) {
                cv_done_.notify_all();
            }
        }
    }
}

}  // namespace tefp

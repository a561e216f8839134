#ifndef TEFP_TASK_QUEUE_H
#define TEFP_TASK_QUEUE_H

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tefp {

/**
 * Task: one unit of work, named after the reference it covers.
 */
class Task {
public:
    explicit Task(std::string reference);
    virtual ~Task() = default;

    const std::string& reference() const { return reference_; }
    virtual void execute() = 0;

private:
    std::string reference_;
};

/**
 * PromiseTask: runs a function and hands its result (or its exception) to
 * the future obtained before submission.
 */
template <typename Result>
class PromiseTask : public Task {
public:
    PromiseTask(std::string reference, std::function<Result()> work)
        : Task(std::move(reference)), work_(std::move(work)) {}

    std::future<Result> get_future() { return promise_.get_future(); }

    void execute() override {
        try {
            promise_.set_value(work_());
        } catch (...) {
            promise_.set_exception(std::current_exception());
        }
    }

private:
    std::function<Result()> work_;
    std::promise<Result> promise_;
};

/**
 * TaskQueue: fixed pool of workers
 * - one producer (the coordinator) submits tasks
 * - workers execute them in submission order
 */
class TaskQueue {
public:
    explicit TaskQueue(int num_workers = 1);

    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false once the queue is closed.
    bool submit(std::unique_ptr<Task> task);

    // Stop accepting tasks; queued tasks still run.
    void close();

    // Block until every submitted task has finished.
    void wait();

    size_t size() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::queue<std::unique_ptr<Task>> queue_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable cv_done_;
    bool closed_ = false;
    size_t pending_ = 0;  // submitted but not finished
};

}  // namespace tefp

#endif  // TEFP_TASK_QUEUE_H

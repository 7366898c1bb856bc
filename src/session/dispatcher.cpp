#include "mapprep/session/dispatcher.hpp"
#include "mapprep/core/errors.hpp"

#include <algorithm>
#include <iostream>

namespace mapprep::session {

WorkerPool::WorkerPool(int workers, Task task, ErrorHandler on_error)
    : task_(std::move(task)), on_error_(std::move(on_error)) {
    if (!task_) {
        throw ValidationError("worker pool needs a task");
    }
    if (!on_error_) {
        on_error_ = [](const std::string& id, const std::string& error) {
            std::cerr << "[worker] session " << id << " failed: " << error << std::endl;
        };
    }
    const int n = std::max(1, workers);
    workers_.reserve(static_cast<size_t>(n));
    for (int w = 0; w < n; ++w) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw MapPrepError("worker pool is shut down");
        }
        queue_.push_back(session_id);
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::string id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            id = queue_.front();
            queue_.pop_front();
            ++in_flight_;
        }

        try {
            task_(id);
        } catch (const std::exception& e) {
            on_error_(id, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
            if (queue_.empty() && in_flight_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace mapprep::session

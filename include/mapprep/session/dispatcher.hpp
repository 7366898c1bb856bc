#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mapprep::session {

class TaskDispatcher {
public:
  virtual ~TaskDispatcher() = default;
  virtual void enqueue(const std::string& session_id) = 0;
};

/**
 * Fixed set of std::thread workers draining a FIFO of session ids.
 * A task that throws is reported through the error handler and does not
 * stop the worker.
 */
class WorkerPool : public TaskDispatcher {
public:
  using Task = std::function<void(const std::string&)>;
  using ErrorHandler = std::function<void(const std::string&, const std::string&)>;

  WorkerPool(int workers, Task task, ErrorHandler on_error = {});
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void enqueue(const std::string& session_id) override;

  // Blocks until the queue is empty and no task is running.
  void wait_idle();
  // Finishes queued work and joins the workers.
  void shutdown();

private:
  void worker_loop();

  Task task_;
  ErrorHandler on_error_;
  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::string> queue_;
  std::vector<std::thread> workers_;
  size_t in_flight_ = 0;
  bool stopping_ = false;
};

} // namespace mapprep::session

// nativebridge kernel: worker pool that runs streaming module calls
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "nb_types.hpp"

namespace nb {

using Task = std::function<void()>;

class NATIVEBRIDGE_API StreamExecutor {
public:
  // 0 picks the hardware concurrency (at least 2 workers).
  explicit StreamExecutor(unsigned int num_workers = 0);
  ~StreamExecutor();

  StreamExecutor(const StreamExecutor&) = delete;
  StreamExecutor& operator=(const StreamExecutor&) = delete;

  void start();
  // Finishes queued and running tasks, then joins the workers.
  void stop();

  template <typename Fn>
  auto post(Fn&& fn) -> std::future<decltype(fn())> {
    using Ret = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
    std::future<Ret> fut = task->get_future();
    submit([task] { (*task)(); });
    return fut;
  }

  // Blocks until no task is queued or running.
  void wait_idle();

private:
  void submit(Task&& task);
  void run_loop();

  unsigned int num_workers_{0};
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  bool stopping_{false};

  std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<Task> queue_;

  std::mutex idle_mtx_;
  std::condition_variable cv_idle_;
  std::atomic<int> pending_{0};
};

}  // namespace nb

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "update_task.hpp"

namespace storykb::worker {

/*
  Thread-safe blocking queue feeding the update workers.

  capacity == 0 means unbounded; otherwise Enqueue blocks while full.
  After Shutdown, Enqueue refuses new tasks and Dequeue drains what is left
  before returning nullopt.
*/
class UpdateQueue {
 public:
  explicit UpdateQueue(std::size_t capacity = 0);

  // false once the queue is shut down
  bool Enqueue(UpdateTask task);

  // blocking wait
  std::optional<UpdateTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<UpdateTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace storykb::worker

#include "update_queue.hpp"

namespace storykb::worker {

UpdateQueue::UpdateQueue(std::size_t capacity) : capacity_(capacity) {
}

bool UpdateQueue::Enqueue(UpdateTask task) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || capacity_ == 0 || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<UpdateTask> UpdateQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  UpdateTask task = std::move(queue_.front());
  queue_.pop();
  lock.unlock();
  not_full_.notify_one();
  return task;
}

void UpdateQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t UpdateQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace storykb::worker

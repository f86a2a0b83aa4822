#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/kb/unified_knowledge_base.hpp"
#include "internal/util/errors.hpp"
#include "update_queue.hpp"

namespace storykb::worker {

/*
  Fixed pool of worker threads running knowledge base writes.

  Each Submit* call queues one facade call and returns a future holding its
  result or the exception it threw. Writes to the same entity serialize on
  the coordinator's entity lock; writes to different entities run in
  parallel.
*/
class UpdateExecutor {
 public:
  UpdateExecutor(std::shared_ptr<kb::UnifiedKnowledgeBase> kb, std::size_t threads, std::size_t queue_capacity = 0);
  ~UpdateExecutor();

  UpdateExecutor(const UpdateExecutor&)            = delete;
  UpdateExecutor& operator=(const UpdateExecutor&) = delete;

  void Start();

  // Runs every queued task, then joins the workers.
  void Stop();

  std::future<model::EntityIdentifier> SubmitStoryElement(std::string element_type, std::string content,
                                                          std::vector<model::RelationshipSpec> relationships = {},
                                                          std::optional<std::string>           natural_key   = std::nullopt);

  std::future<void> SubmitElementProperties(model::EntityIdentifier entity_id, std::string element_type, model::Properties properties);

  std::future<void> SubmitLink(model::EntityIdentifier source_id, std::vector<model::RelationshipSpec> relationships);

  // InvalidState once stopped.
  template <typename Fn>
  auto Submit(std::string kind, Fn&& fn) -> std::future<std::invoke_result_t<Fn&, kb::UnifiedKnowledgeBase&>> {
    using Result = std::invoke_result_t<Fn&, kb::UnifiedKnowledgeBase&>;

    auto task   = std::make_shared<std::packaged_task<Result()>>([kb = kb_, fn = std::forward<Fn>(fn)]() mutable { return fn(*kb); });
    auto future = task->get_future();
    if (!queue_.Enqueue(UpdateTask{std::move(kind), [task] { (*task)(); }})) {
      throw util::InvalidState("update executor is stopped");
    }
    return future;
  }

  bool Running() const {
    return running_;
  }

  std::size_t ThreadCount() const {
    return thread_count_;
  }

 private:
  void Run(std::size_t index);

  std::shared_ptr<kb::UnifiedKnowledgeBase> kb_;
  std::size_t                               thread_count_;
  UpdateQueue                               queue_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace storykb::worker

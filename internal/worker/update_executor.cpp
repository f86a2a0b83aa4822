#include "update_executor.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace storykb::worker {

UpdateExecutor::UpdateExecutor(std::shared_ptr<kb::UnifiedKnowledgeBase> kb, std::size_t threads, std::size_t queue_capacity)
    : kb_(std::move(kb)), thread_count_(threads == 0 ? 1 : threads), queue_(queue_capacity) {
  if (!kb_) {
    throw std::invalid_argument("UpdateExecutor: knowledge base is null");
  }
}

UpdateExecutor::~UpdateExecutor() {
  Stop();
}

void UpdateExecutor::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&UpdateExecutor::Run, this, i);
  }
  STORYKB_LOG_INFO("update executor started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void UpdateExecutor::Stop() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  if (running_.exchange(false)) {
    STORYKB_LOG_INFO("update executor stopped");
  }
}

std::future<model::EntityIdentifier> UpdateExecutor::SubmitStoryElement(std::string element_type, std::string content,
                                                                        std::vector<model::RelationshipSpec> relationships,
                                                                        std::optional<std::string>           natural_key) {
  return Submit("update_story_element", [element_type = std::move(element_type), content = std::move(content),
                                         relationships = std::move(relationships),
                                         natural_key   = std::move(natural_key)](kb::UnifiedKnowledgeBase& kb) {
    return kb.UpdateStoryElement(element_type, content, relationships, natural_key);
  });
}

std::future<void> UpdateExecutor::SubmitElementProperties(model::EntityIdentifier entity_id, std::string element_type,
                                                          model::Properties properties) {
  return Submit("update_element_properties", [entity_id = std::move(entity_id), element_type = std::move(element_type),
                                              properties = std::move(properties)](kb::UnifiedKnowledgeBase& kb) {
    kb.UpdateElementProperties(entity_id, element_type, properties);
  });
}

std::future<void> UpdateExecutor::SubmitLink(model::EntityIdentifier source_id, std::vector<model::RelationshipSpec> relationships) {
  return Submit("link_elements", [source_id = std::move(source_id), relationships = std::move(relationships)](kb::UnifiedKnowledgeBase& kb) {
    kb.LinkElements(source_id, relationships);
  });
}

void UpdateExecutor::Run(std::size_t index) {
  for (;;) {
    auto task = queue_.Dequeue();
    if (!task) break;

    // the packaged task stores any exception in the caller's future
    task->run();
  }
  STORYKB_LOG_DEBUG("update worker exiting", {observability::IntField("worker", static_cast<std::int64_t>(index))});
}

} // namespace storykb::worker

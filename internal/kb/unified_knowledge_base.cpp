#include "unified_knowledge_base.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::kb {

namespace {

void ValidateRelationships(const std::vector<model::RelationshipSpec>& relationships) {
  for (const auto& rel : relationships) {
    if (rel.type.empty()) {
      throw util::ValidationError("relationship type must not be empty");
    }
    if (!util::IsCanonicalUUID(rel.target_id)) {
      throw util::ValidationError("relationship target is not a canonical identifier: '" + rel.target_id + "'");
    }
  }
}

} // namespace

UnifiedKnowledgeBase::UnifiedKnowledgeBase(std::shared_ptr<registry::EntityRegistry>             registry,
                                           std::shared_ptr<coordinator::TransactionCoordinator> coordinator,
                                           std::shared_ptr<ledger::ChangeLedger> ledger, KnowledgeBaseOptions options)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)), ledger_(std::move(ledger)), options_(options) {
  if (!registry_ || !coordinator_ || !ledger_) {
    throw std::invalid_argument("UnifiedKnowledgeBase: registry, coordinator and ledger are required");
  }
}

std::string UnifiedKnowledgeBase::DefaultNaturalKey(const std::string& element_type, const std::string& content_hash) {
  return element_type + ":" + content_hash;
}

model::EntityIdentifier UnifiedKnowledgeBase::UpdateStoryElement(const std::string& element_type, const std::string& content,
                                                                 const std::vector<model::RelationshipSpec>& relationships,
                                                                 const std::optional<std::string>&           natural_key) {
  if (element_type.empty()) {
    throw util::ValidationError("update story element: element_type must not be empty");
  }
  if (natural_key && natural_key->empty()) {
    throw util::ValidationError("update story element: explicit natural key must not be empty");
  }
  ValidateRelationships(relationships);

  observability::SpanScope span("storykb.kb.update_story_element");
  span.SetAttribute("element_type", element_type);

  const auto content_hash = util::ContentHash(content);
  const auto entity_id    = registry_->ResolveOrCreate(natural_key ? *natural_key : DefaultNaturalKey(element_type, content_hash));
  span.SetAttribute("entity_id", entity_id);

  auto handle = coordinator_->Begin(entity_id, model::ChangeType::kContent);
  coordinator_->StageVectorOp(*handle, store::VectorUpsert{entity_id, content, {{"type", element_type}}});
  coordinator_->StageGraphOp(*handle, store::GraphNodeUpsert{entity_id, element_type, content_hash, {}});
  StageRelationships(*handle, relationships);
  Run(*handle);

  STORYKB_LOG_DEBUG("story element updated", {observability::StringField("entity_id", entity_id), observability::StringField("type", element_type),
                                              observability::StringField("content_hash", content_hash),
                                              observability::IntField("relationships", static_cast<std::int64_t>(relationships.size()))});
  return entity_id;
}

void UnifiedKnowledgeBase::UpdateElementProperties(const model::EntityIdentifier& entity_id, const std::string& element_type,
                                                   const model::Properties& properties) {
  if (properties.empty()) {
    throw util::ValidationError("update element properties: no properties given");
  }
  for (const auto& [key, value] : properties) {
    if (key.empty()) {
      throw util::ValidationError("update element properties: property names must not be empty");
    }
  }
  if (!registry_->Contains(entity_id)) {
    throw util::NotFound("update element properties: unknown entity " + entity_id);
  }

  observability::SpanScope span("storykb.kb.update_element_properties");
  span.SetAttribute("entity_id", entity_id);

  auto handle = coordinator_->Begin(entity_id, model::ChangeType::kMetadata);
  coordinator_->StageGraphOp(*handle, store::GraphNodeUpsert{entity_id, element_type, std::nullopt, properties});
  Run(*handle);
}

void UnifiedKnowledgeBase::LinkElements(const model::EntityIdentifier& source_id, const std::vector<model::RelationshipSpec>& relationships) {
  if (relationships.empty()) {
    throw util::ValidationError("link elements: no relationships given");
  }
  ValidateRelationships(relationships);
  if (!registry_->Contains(source_id)) {
    throw util::NotFound("link elements: unknown entity " + source_id);
  }

  observability::SpanScope span("storykb.kb.link_elements");
  span.SetAttribute("entity_id", source_id);

  auto handle = coordinator_->Begin(source_id, model::ChangeType::kRelationship);
  StageRelationships(*handle, relationships);
  Run(*handle);
}

std::vector<model::ChangeEvent> UnifiedKnowledgeBase::Timeline(const model::EntityIdentifier& entity_id) {
  return ledger_->History(entity_id);
}

void UnifiedKnowledgeBase::StageRelationships(coordinator::TransactionHandle& handle, const std::vector<model::RelationshipSpec>& relationships) {
  for (const auto& rel : relationships) {
    coordinator_->StageGraphOp(handle, store::GraphRelationshipUpsert{model::Relationship{handle.EntityId(), rel.target_id, rel.type}});
  }
}

void UnifiedKnowledgeBase::Run(coordinator::TransactionHandle& handle) {
  coordinator_->Prepare(handle, util::DeadlineAfter(options_.prepare_timeout));
  coordinator_->Commit(handle, util::DeadlineAfter(options_.commit_timeout));
}

} // namespace storykb::kb

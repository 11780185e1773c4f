#include "record_checkpointer.hpp"

#include "internal/observability/logging.hpp"

namespace shardfeed::checkpoint {

PreparedCheckpointer::PreparedCheckpointer(std::optional<std::string> pending_sequence, RecordProcessorCheckpointer& checkpointer)
    : pending_sequence_(std::move(pending_sequence)), checkpointer_(&checkpointer) {
}

Result PreparedCheckpointer::Checkpoint() {
  return checkpointer_->Checkpoint(pending_sequence_);
}

RecordProcessorCheckpointer::RecordProcessorCheckpointer(model::ShardStatus& shard, Checkpointer& checkpointer)
    : shard_(shard), checkpointer_(checkpointer) {
}

Result RecordProcessorCheckpointer::Checkpoint(const std::optional<std::string>& sequence_number) {
  if (sequence_number.has_value() && sequence_number->empty()) {
    return Result::Err(ErrorCode::Conflict, "checkpoint sequence number must not be empty");
  }

  const auto previous = shard_.GetCheckpoint();
  shard_.SetCheckpoint(sequence_number.value_or(model::kShardEnd));

  auto result = checkpointer_.CheckpointSequence(shard_);
  if (!result) {
    shard_.SetCheckpoint(previous);
    SHARDFEED_LOG_WARN("Checkpoint rejected", {observability::StringField("shard_id", shard_.Id()),
                                               observability::StringField("error", result.message)});
  }
  return result;
}

PreparedCheckpointer RecordProcessorCheckpointer::PrepareCheckpoint(std::optional<std::string> sequence_number) {
  return PreparedCheckpointer(std::move(sequence_number), *this);
}

} // namespace shardfeed::checkpoint

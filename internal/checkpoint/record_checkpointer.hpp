#pragma once

#include <optional>
#include <string>

#include "internal/checkpoint/checkpointer.hpp"
#include "internal/model/shard_status.hpp"

namespace shardfeed::checkpoint {

class RecordProcessorCheckpointer;

/*
  A checkpoint captured now and committed later.
*/
class PreparedCheckpointer {
 public:
  PreparedCheckpointer(std::optional<std::string> pending_sequence, RecordProcessorCheckpointer& checkpointer);

  const std::optional<std::string>& GetPendingCheckpoint() const {
    return pending_sequence_;
  }

  Result Checkpoint();

 private:
  std::optional<std::string>   pending_sequence_;
  RecordProcessorCheckpointer* checkpointer_;
};

/*
  Checkpoint handle given to the record processor.

  Binds the store to the shard being processed so the processor only ever
  names a sequence number.
*/
class RecordProcessorCheckpointer {
 public:
  RecordProcessorCheckpointer(model::ShardStatus& shard, Checkpointer& checkpointer);

  // Records progress up to and including `sequence_number`. No sequence
  // marks the shard as fully processed (SHARD_END).
  Result Checkpoint(const std::optional<std::string>& sequence_number);

  PreparedCheckpointer PrepareCheckpoint(std::optional<std::string> sequence_number);

  const std::string& ShardId() const {
    return shard_.Id();
  }

 private:
  model::ShardStatus& shard_;
  Checkpointer&       checkpointer_;
};

} // namespace shardfeed::checkpoint

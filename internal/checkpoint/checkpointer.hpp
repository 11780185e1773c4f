#pragma once

#include <string>

#include "internal/checkpoint/result.hpp"
#include "internal/model/shard_status.hpp"

namespace shardfeed::checkpoint {

/*
  Lease/checkpoint store abstraction.

  GUARANTEES required from implementations:

  - Lease operations on one shard are serialized
  - GetLease fails with LeaseNotAcquired while another owner holds an
    unexpired lease
  - CheckpointSequence only succeeds for the current lease owner
*/
class Checkpointer {
 public:
  virtual ~Checkpointer() = default;

  // Acquire or renew the lease on `shard` for `owner`. On success the
  // shard's lease owner and lease timeout are updated.
  virtual Result GetLease(model::ShardStatus& shard, const std::string& owner) = 0;

  // Load the recorded checkpoint into `shard`. NotFound if none exists.
  virtual Result FetchCheckpoint(model::ShardStatus& shard) = 0;

  // Persist the shard's current checkpoint.
  virtual Result CheckpointSequence(const model::ShardStatus& shard) = 0;

  // Clears the lease if `owner` still holds it; LeaseNotAcquired otherwise.
  virtual Result RemoveLeaseOwner(const std::string& shard_id, const std::string& owner) = 0;
};

} // namespace shardfeed::checkpoint

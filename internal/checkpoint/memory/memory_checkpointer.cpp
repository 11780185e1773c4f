#include "memory_checkpointer.hpp"

namespace shardfeed::checkpoint::memory {

MemoryCheckpointer::MemoryCheckpointer(util::Duration lease_duration, util::Clock& clock)
    : lease_duration_(lease_duration), clock_(clock) {
}

Result MemoryCheckpointer::GetLease(model::ShardStatus& shard, const std::string& owner) {
  std::lock_guard lock(mutex_);

  const auto now    = clock_.Now();
  auto&      record = leases_[shard.Id()];
  if (!record.owner.empty() && record.owner != owner && !IsExpired(record, now)) {
    return Result::Err(ErrorCode::LeaseNotAcquired, "shard " + shard.Id() + " is leased by " + record.owner);
  }

  record.owner         = owner;
  record.lease_timeout = now + lease_duration_;

  shard.SetLeaseOwner(owner);
  shard.SetLeaseTimeout(record.lease_timeout);
  if (!record.checkpoint.empty()) {
    shard.SetCheckpoint(record.checkpoint);
  }
  return Result::Ok();
}

Result MemoryCheckpointer::FetchCheckpoint(model::ShardStatus& shard) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(shard.Id());
  if (it == leases_.end() || it->second.checkpoint.empty()) {
    return Result::Err(ErrorCode::NotFound, "no checkpoint recorded for shard " + shard.Id());
  }

  shard.SetCheckpoint(it->second.checkpoint);
  return Result::Ok();
}

Result MemoryCheckpointer::CheckpointSequence(const model::ShardStatus& shard) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(shard.Id());
  if (it == leases_.end() || it->second.owner.empty() || it->second.owner != shard.GetLeaseOwner()) {
    return Result::Err(ErrorCode::LeaseNotAcquired, "checkpoint rejected: shard " + shard.Id() + " is not leased by this owner");
  }

  it->second.checkpoint = shard.GetCheckpoint();
  return Result::Ok();
}

Result MemoryCheckpointer::RemoveLeaseOwner(const std::string& shard_id, const std::string& owner) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(shard_id);
  if (it == leases_.end() || it->second.owner.empty()) return Result::Ok();
  if (it->second.owner != owner) {
    return Result::Err(ErrorCode::LeaseNotAcquired, "shard " + shard_id + " is leased by " + it->second.owner);
  }

  it->second.owner.clear();
  it->second.lease_timeout = {};
  return Result::Ok();
}

void MemoryCheckpointer::PutCheckpoint(const std::string& shard_id, const std::string& checkpoint) {
  std::lock_guard lock(mutex_);
  leases_[shard_id].checkpoint = checkpoint;
}

std::optional<MemoryCheckpointer::LeaseRecord> MemoryCheckpointer::Lookup(const std::string& shard_id) const {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(shard_id);
  if (it == leases_.end()) return std::nullopt;
  return it->second;
}

} // namespace shardfeed::checkpoint::memory

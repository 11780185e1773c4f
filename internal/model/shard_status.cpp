#include "shard_status.hpp"

#include <mutex>

namespace shardfeed::model {

ShardStatus::ShardStatus(std::string id, std::string parent_shard_id)
    : id_(std::move(id)), parent_shard_id_(std::move(parent_shard_id)) {
}

std::string ShardStatus::GetCheckpoint() const {
  std::shared_lock lock(mutex_);
  return checkpoint_;
}

void ShardStatus::SetCheckpoint(std::string checkpoint) {
  std::unique_lock lock(mutex_);
  checkpoint_ = std::move(checkpoint);
}

std::string ShardStatus::GetLeaseOwner() const {
  std::shared_lock lock(mutex_);
  return lease_owner_;
}

void ShardStatus::SetLeaseOwner(std::string owner) {
  std::unique_lock lock(mutex_);
  lease_owner_ = std::move(owner);
}

util::TimePoint ShardStatus::GetLeaseTimeout() const {
  std::shared_lock lock(mutex_);
  return lease_timeout_;
}

void ShardStatus::SetLeaseTimeout(util::TimePoint timeout) {
  std::unique_lock lock(mutex_);
  lease_timeout_ = timeout;
}

} // namespace shardfeed::model

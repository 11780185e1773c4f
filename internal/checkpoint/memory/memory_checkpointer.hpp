#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/checkpoint/checkpointer.hpp"
#include "internal/util/time.hpp"

namespace shardfeed::checkpoint::memory {

/*
  In-process lease/checkpoint store.

  Leases expire `lease_duration` after they were last acquired or renewed,
  as measured by the injected clock.
*/
class MemoryCheckpointer final : public Checkpointer {
 public:
  struct LeaseRecord {
    std::string     owner;
    util::TimePoint lease_timeout{};
    std::string     checkpoint;
  };

  explicit MemoryCheckpointer(util::Duration lease_duration, util::Clock& clock = util::DefaultClock());

  Result GetLease(model::ShardStatus& shard, const std::string& owner) override;
  Result FetchCheckpoint(model::ShardStatus& shard) override;
  Result CheckpointSequence(const model::ShardStatus& shard) override;
  Result RemoveLeaseOwner(const std::string& shard_id, const std::string& owner) override;

  // Records a checkpoint without any lease check, e.g. a parent shard
  // finished by another worker.
  void PutCheckpoint(const std::string& shard_id, const std::string& checkpoint);

  std::optional<LeaseRecord> Lookup(const std::string& shard_id) const;

 private:
  bool IsExpired(const LeaseRecord& record, util::TimePoint now) const {
    return record.lease_timeout <= now;
  }

  const util::Duration lease_duration_;
  util::Clock&         clock_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, LeaseRecord> leases_;
};

} // namespace shardfeed::checkpoint::memory

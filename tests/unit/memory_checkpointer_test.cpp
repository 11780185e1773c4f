#include "internal/checkpoint/memory/memory_checkpointer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "tests/unit/fakes.hpp"

namespace {

using shardfeed::checkpoint::ErrorCode;
using shardfeed::checkpoint::memory::MemoryCheckpointer;
using shardfeed::model::ShardStatus;
using shardfeed::testing::ManualClock;

using std::chrono::seconds;

void TestLeaseGrantedOnUnownedShard() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        shard("shard-1");

  auto result = store.GetLease(shard, "worker-1");
  assert(result);
  assert(shard.GetLeaseOwner() == "worker-1");
  assert(shard.GetLeaseTimeout() == clock.Now() + seconds(10));
  assert(store.Lookup("shard-1")->owner == "worker-1");
}

void TestLiveLeaseBlocksOtherOwners() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        mine("shard-1");
  ShardStatus        theirs("shard-1");

  assert(store.GetLease(mine, "worker-1"));
  auto result = store.GetLease(theirs, "worker-2");
  assert(result.code == ErrorCode::LeaseNotAcquired);
  assert(theirs.GetLeaseOwner().empty());
}

void TestExpiredLeaseCanBeTakenOver() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        mine("shard-1");
  ShardStatus        theirs("shard-1");

  assert(store.GetLease(mine, "worker-1"));
  clock.Advance(seconds(10));
  assert(store.GetLease(theirs, "worker-2"));
  assert(store.Lookup("shard-1")->owner == "worker-2");
}

void TestRenewalExtendsTimeout() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        shard("shard-1");

  assert(store.GetLease(shard, "worker-1"));
  clock.Advance(seconds(6));
  assert(store.GetLease(shard, "worker-1"));
  assert(shard.GetLeaseTimeout() == clock.Now() + seconds(10));
}

void TestLeaseLoadsRecordedCheckpoint() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  store.PutCheckpoint("shard-1", "00000000000000000042");

  ShardStatus shard("shard-1");
  assert(store.GetLease(shard, "worker-1"));
  assert(shard.GetCheckpoint() == "00000000000000000042");
}

void TestFetchCheckpoint() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        shard("shard-1");

  assert(store.FetchCheckpoint(shard).code == ErrorCode::NotFound);

  store.PutCheckpoint("shard-1", "00000000000000000007");
  assert(store.FetchCheckpoint(shard));
  assert(shard.GetCheckpoint() == "00000000000000000007");
}

void TestCheckpointRequiresLeaseOwnership() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        shard("shard-1");

  shard.SetCheckpoint("00000000000000000001");
  assert(store.CheckpointSequence(shard).code == ErrorCode::LeaseNotAcquired);

  assert(store.GetLease(shard, "worker-1"));
  shard.SetCheckpoint("00000000000000000002");
  assert(store.CheckpointSequence(shard));
  assert(store.Lookup("shard-1")->checkpoint == "00000000000000000002");

  // a stale view of the shard cannot overwrite the new owner's progress
  clock.Advance(seconds(11));
  ShardStatus other("shard-1");
  assert(store.GetLease(other, "worker-2"));
  shard.SetCheckpoint("00000000000000000003");
  assert(store.CheckpointSequence(shard).code == ErrorCode::LeaseNotAcquired);
  assert(store.Lookup("shard-1")->checkpoint == "00000000000000000002");
}

void TestRemoveLeaseOwnerIsOwnerConditional() {
  ManualClock        clock;
  MemoryCheckpointer store(seconds(10), clock);
  ShardStatus        shard("shard-1");

  assert(store.RemoveLeaseOwner("unknown", "worker-1"));

  assert(store.GetLease(shard, "worker-1"));
  assert(store.RemoveLeaseOwner("shard-1", "worker-2").code == ErrorCode::LeaseNotAcquired);
  assert(store.Lookup("shard-1")->owner == "worker-1");

  assert(store.RemoveLeaseOwner("shard-1", "worker-1"));
  assert(store.Lookup("shard-1")->owner.empty());

  // released shards are free for anyone right away
  ShardStatus other("shard-1");
  assert(store.GetLease(other, "worker-2"));
}

} // namespace

int main() {
  TestLeaseGrantedOnUnownedShard();
  TestLiveLeaseBlocksOtherOwners();
  TestExpiredLeaseCanBeTakenOver();
  TestRenewalExtendsTimeout();
  TestLeaseLoadsRecordedCheckpoint();
  TestFetchCheckpoint();
  TestCheckpointRequiresLeaseOwnership();
  TestRemoveLeaseOwnerIsOwnerConditional();

  std::cout << "shardfeed_unit_memory_checkpointer: pass\n";
  return 0;
}

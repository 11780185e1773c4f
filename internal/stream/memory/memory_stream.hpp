#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/stream/stream_client.hpp"
#include "internal/util/time.hpp"

namespace shardfeed::stream::memory {

/*
  In-process stream holding each shard as an append-only record vector.

  Sequence numbers are zero-padded decimal strings, increasing across the
  whole stream so they compare lexicographically. Iterators stay valid for
  the lifetime of the stream.
*/
class MemoryStream final : public StreamClient {
 public:
  static constexpr int32_t kMaxRecordsPerCall = 10000;

  explicit MemoryStream(std::string stream_name, util::Clock& clock = util::DefaultClock());

  void CreateShard(const std::string& shard_id);

  // Returns the sequence number assigned to the record.
  std::string PutRecord(const std::string& shard_id, const std::string& partition_key, const std::string& data);

  // No records can be added afterwards; readers get no next iterator once
  // they have read past the last record.
  void CloseShard(const std::string& shard_id);

  Result GetShardIterator(const shardfeed::v1::GetShardIteratorRequest& request,
                          shardfeed::v1::GetShardIteratorResponse*      response) override;

  Result GetRecords(const shardfeed::v1::GetRecordsRequest& request, shardfeed::v1::GetRecordsResponse* response) override;

 private:
  struct Shard {
    std::vector<shardfeed::v1::Record> records;
    bool                               closed = false;
  };

  struct Cursor {
    std::string shard_id;
    std::size_t position = 0;
  };

  std::string IssueIterator(const std::string& shard_id, std::size_t position);

  static std::size_t FindSequence(const Shard& shard, const std::string& sequence_number, bool* found);

  const std::string stream_name_;
  util::Clock&      clock_;

  std::mutex                              mutex_;
  std::unordered_map<std::string, Shard>  shards_;
  std::unordered_map<std::string, Cursor> iterators_;
  uint64_t                                next_sequence_ = 1;
  uint64_t                                next_iterator_ = 1;
};

} // namespace shardfeed::stream::memory

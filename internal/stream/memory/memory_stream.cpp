#include "memory_stream.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace shardfeed::stream::memory {

using namespace shardfeed::v1;

namespace {

std::string FormatSequence(uint64_t value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%020llu", static_cast<unsigned long long>(value));
  return buffer;
}

} // namespace

MemoryStream::MemoryStream(std::string stream_name, util::Clock& clock) : stream_name_(std::move(stream_name)), clock_(clock) {
}

void MemoryStream::CreateShard(const std::string& shard_id) {
  std::lock_guard lock(mutex_);
  shards_.try_emplace(shard_id);
}

std::string MemoryStream::PutRecord(const std::string& shard_id, const std::string& partition_key, const std::string& data) {
  std::lock_guard lock(mutex_);

  auto it = shards_.find(shard_id);
  if (it == shards_.end()) {
    throw std::invalid_argument("put record: unknown shard " + shard_id);
  }
  if (it->second.closed) {
    throw std::invalid_argument("put record: shard " + shard_id + " is closed");
  }

  Record record;
  record.set_sequence_number(FormatSequence(next_sequence_++));
  record.set_partition_key(partition_key);
  record.set_data(data);
  *record.mutable_approximate_arrival_timestamp() = util::ToProto(clock_.Now());

  it->second.records.push_back(record);
  return record.sequence_number();
}

void MemoryStream::CloseShard(const std::string& shard_id) {
  std::lock_guard lock(mutex_);

  auto it = shards_.find(shard_id);
  if (it == shards_.end()) {
    throw std::invalid_argument("close shard: unknown shard " + shard_id);
  }
  it->second.closed = true;
}

std::string MemoryStream::IssueIterator(const std::string& shard_id, std::size_t position) {
  auto token        = stream_name_ + "/" + shard_id + "/" + std::to_string(next_iterator_++);
  iterators_[token] = Cursor{shard_id, position};
  return token;
}

std::size_t MemoryStream::FindSequence(const Shard& shard, const std::string& sequence_number, bool* found) {
  auto it = std::lower_bound(shard.records.begin(), shard.records.end(), sequence_number,
                             [](const Record& record, const std::string& seq) { return record.sequence_number() < seq; });
  *found = it != shard.records.end() && it->sequence_number() == sequence_number;
  return static_cast<std::size_t>(it - shard.records.begin());
}

Result MemoryStream::GetShardIterator(const GetShardIteratorRequest& request, GetShardIteratorResponse* response) {
  std::lock_guard lock(mutex_);

  if (request.stream_name() != stream_name_) {
    return Result::Err(ErrorCode::ResourceNotFound, "stream " + request.stream_name() + " not found");
  }

  auto it = shards_.find(request.shard_id());
  if (it == shards_.end()) {
    return Result::Err(ErrorCode::ResourceNotFound, "shard " + request.shard_id() + " not found");
  }

  const auto& shard    = it->second;
  const auto& position = request.starting_position();
  std::size_t index    = 0;

  switch (position.type()) {
    case TRIM_HORIZON:
      index = 0;
      break;

    case LATEST:
      index = shard.records.size();
      break;

    case AT_SEQUENCE_NUMBER:
    case AFTER_SEQUENCE_NUMBER: {
      if (position.sequence_number().empty()) {
        return Result::Err(ErrorCode::InvalidArgument, "starting sequence number is required");
      }
      bool found = false;
      index      = FindSequence(shard, position.sequence_number(), &found);
      if (found && position.type() == AFTER_SEQUENCE_NUMBER) ++index;
      break;
    }

    case AT_TIMESTAMP: {
      const auto target = util::FromProto(position.timestamp());
      auto       first  = std::find_if(shard.records.begin(), shard.records.end(), [&](const Record& record) {
        return util::FromProto(record.approximate_arrival_timestamp()) >= target;
      });
      index             = static_cast<std::size_t>(first - shard.records.begin());
      break;
    }

    default:
      return Result::Err(ErrorCode::InvalidArgument, "unsupported shard iterator type");
  }

  response->set_shard_iterator(IssueIterator(request.shard_id(), index));
  return Result::Ok();
}

Result MemoryStream::GetRecords(const GetRecordsRequest& request, GetRecordsResponse* response) {
  std::lock_guard lock(mutex_);

  if (request.limit() < 1 || request.limit() > kMaxRecordsPerCall) {
    return Result::Err(ErrorCode::InvalidArgument, "limit must be in [1, 10000]");
  }

  auto cursor_it = iterators_.find(request.shard_iterator());
  if (cursor_it == iterators_.end()) {
    return Result::Err(ErrorCode::ExpiredIterator, "shard iterator not recognized");
  }

  const auto  cursor = cursor_it->second;
  const auto& shard  = shards_.at(cursor.shard_id);

  const auto begin = std::min(cursor.position, shard.records.size());
  const auto end   = std::min(begin + static_cast<std::size_t>(request.limit()), shard.records.size());
  for (auto i = begin; i < end; ++i) {
    *response->add_records() = shard.records[i];
  }

  if (end < shard.records.size()) {
    const auto behind = clock_.Now() - util::FromProto(shard.records[end].approximate_arrival_timestamp());
    response->set_millis_behind_latest(std::max<int64_t>(0, std::chrono::duration_cast<std::chrono::milliseconds>(behind).count()));
  } else {
    response->set_millis_behind_latest(0);
  }

  if (!(shard.closed && end == shard.records.size())) {
    response->set_next_shard_iterator(IssueIterator(cursor.shard_id, end));
  }
  return Result::Ok();
}

} // namespace shardfeed::stream::memory

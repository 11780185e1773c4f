#pragma once

#include "internal/stream/result.hpp"
#include "shardfeed/v1/stream.pb.h"

namespace shardfeed::stream {

/*
  Request/response API of the stream service, as used by one shard
  consumer. Implementations own the transport.
*/
class StreamClient {
 public:
  virtual ~StreamClient() = default;

  virtual Result GetShardIterator(const shardfeed::v1::GetShardIteratorRequest& request,
                                  shardfeed::v1::GetShardIteratorResponse*      response) = 0;

  virtual Result GetRecords(const shardfeed::v1::GetRecordsRequest& request, shardfeed::v1::GetRecordsResponse* response) = 0;
};

} // namespace shardfeed::stream

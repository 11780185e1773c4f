#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/checkpoint/memory/memory_checkpointer.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/consumer_settings.hpp"
#include "internal/consumer/polling_shard_consumer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processor/record_processor.hpp"
#include "internal/stream/memory/memory_stream.hpp"
#include "internal/util/errors.hpp"
#include "shardfeed/v1.hpp"

using shardfeed::observability::BoolField;
using shardfeed::observability::IntField;
using shardfeed::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr const char* kShardId = "shard-0001";

const char* OutcomeName(shardfeed::consumer::RunOutcome outcome) {
  switch (outcome) {
    case shardfeed::consumer::RunOutcome::kShardClosed:
      return "shard_closed";
    case shardfeed::consumer::RunOutcome::kStopRequested:
      return "stop_requested";
    case shardfeed::consumer::RunOutcome::kLeaseLost:
      return "lease_lost";
  }
  return "unknown";
}

// Logs every batch and checkpoints after it.
class LoggingProcessor final : public shardfeed::processor::RecordProcessor {
 public:
  void Initialize(const shardfeed::processor::InitializationInput& input) override {
    SHARDFEED_LOG_INFO("Processor initialized", {StringField("checkpoint", input.checkpoint)});
  }

  void ProcessRecords(const shardfeed::processor::ProcessRecordsInput& input) override {
    for (const auto& record : input.records) {
      SHARDFEED_LOG_DEBUG("Record", {StringField("sequence_number", record.sequence_number()),
                                     StringField("partition_key", record.partition_key()), IntField("bytes", record.data().size())});
    }
    if (input.records.empty()) return;

    const auto& last   = input.records.Get(input.records.size() - 1);
    auto        result = input.checkpointer->Checkpoint(last.sequence_number());
    SHARDFEED_LOG_INFO("Batch processed", {IntField("count", input.records.size()), IntField("millis_behind_latest", input.millis_behind_latest),
                                           StringField("checkpoint", last.sequence_number()), BoolField("stored", static_cast<bool>(result))});
  }

  void Shutdown(const shardfeed::processor::ShutdownInput& input) override {
    if (input.reason == shardfeed::processor::ShutdownReason::kTerminate) {
      auto result = input.checkpointer->Checkpoint(std::nullopt);
      if (!result) {
        SHARDFEED_LOG_WARN("Final checkpoint rejected", {StringField("error", result.message)});
      }
    }
    SHARDFEED_LOG_INFO("Processor shut down", {StringField("reason", shardfeed::processor::ToString(input.reason))});
  }
};

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  int64_t     record_count = 100;
  if (argc == 2) {
    config_path = argv[1];
  } else if ((argc == 3 || argc == 5) && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    if (argc == 5 && std::string(argv[3]) == "--records") {
      record_count = std::strtoll(argv[4], nullptr, 10);
    } else if (argc == 5) {
      std::cerr << "Usage: shardfeed <config.yaml> OR shardfeed --config <config.yaml> [--records N]" << std::endl;
      return 1;
    }
  } else {
    std::cerr << "Usage: shardfeed <config.yaml> OR shardfeed --config <config.yaml> [--records N]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shardfeed::config::ConfigLoader::LoadFromYaml(config_path);
    shardfeed::observability::InitializeLogging(config);

    auto settings = shardfeed::config::ConsumerSettings::FromConfig(config);

    // ------------------------------------------------------------
    // Seed an in-process stream and lease store
    // ------------------------------------------------------------
    auto stream = std::make_shared<shardfeed::stream::memory::MemoryStream>(settings.stream_name);
    stream->CreateShard(kShardId);
    for (int64_t i = 0; i < record_count; ++i) {
      stream->PutRecord(kShardId, "key-" + std::to_string(i % 8), "record-" + std::to_string(i));
    }
    stream->CloseShard(kShardId);

    auto checkpointer = std::make_shared<shardfeed::checkpoint::memory::MemoryCheckpointer>(settings.lease_duration);
    auto shard        = std::make_shared<shardfeed::model::ShardStatus>(kShardId);
    auto lease        = checkpointer->GetLease(*shard, settings.worker_id);
    if (!lease) {
      throw shardfeed::util::CheckpointFailure("acquire lease: " + lease.message);
    }

    shardfeed::consumer::PollingShardConsumer consumer(settings, shard, stream, checkpointer, std::make_shared<LoggingProcessor>());

    // Register signal handlers before starting the consumer to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    SHARDFEED_LOG_INFO("Shardfeed started", {StringField("stream", settings.stream_name), StringField("shard_id", kShardId),
                                             StringField("worker_id", settings.worker_id)});

    auto run = std::async(std::launch::async, [&consumer] { return consumer.Run(); });
    while (run.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
      if (!g_running) consumer.RequestStop();
    }

    const auto outcome = run.get();
    SHARDFEED_LOG_INFO("Shardfeed stopped", {StringField("outcome", OutcomeName(outcome))});
    shardfeed::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SHARDFEED_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    shardfeed::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

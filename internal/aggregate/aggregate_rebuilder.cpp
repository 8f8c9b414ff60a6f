#include "internal/aggregate/aggregate_rebuilder.hpp"

#include "internal/observability/logging.hpp"

namespace chronicle::aggregate {

AggregateRebuilder::AggregateRebuilder(std::shared_ptr<const events::EventLog> log, std::shared_ptr<const codec::Codec> codec)
    : log_(std::move(log)), codec_(std::move(codec)) {
}

void AggregateRebuilder::LogRebuilt(const std::string& stream_id, uint64_t version, uint64_t skipped) {
  CHRONICLE_LOG_DEBUG("Rebuilt aggregate", {observability::StringField("stream_id", stream_id),
                                            observability::UintField("version", version),
                                            observability::UintField("unhandled_events", skipped)});
}

} // namespace chronicle::aggregate

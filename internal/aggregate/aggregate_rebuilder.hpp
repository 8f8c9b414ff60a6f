#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/aggregate/aggregate_folder.hpp"
#include "internal/codec/codec.hpp"
#include "internal/events/event_log.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::aggregate {

template <typename TState>
struct Versioned {
  TState   state;
  uint64_t version = 0; // version of the last folded event
};

/*
  Rebuilds aggregate state from its stream on every call. No snapshots,
  no caching: the result reflects every event committed before the read.
*/
class AggregateRebuilder {
 public:
  AggregateRebuilder(std::shared_ptr<const events::EventLog> log, std::shared_ptr<const codec::Codec> codec);

  // nullopt when the stream has no events.
  template <typename TState>
  std::optional<TState> Rebuild(const std::string& stream_id, const AggregateFolder<TState>& folder) const {
    auto rebuilt = RebuildAt(stream_id, folder, events::kLatestVersion);
    if (!rebuilt) return std::nullopt;
    return std::move(rebuilt->state);
  }

  // State as of to_version, together with the version it reflects.
  template <typename TState>
  std::optional<Versioned<TState>> RebuildAt(const std::string& stream_id, const AggregateFolder<TState>& folder,
                                             uint64_t to_version) const {
    auto stream = log_->FetchStream(stream_id, 1, to_version);

    std::optional<Versioned<TState>> out;
    uint64_t                         skipped = 0;
    while (auto event = stream.Next()) {
      if (!out) out.emplace();
      try {
        if (!folder.Fold(out->state, *codec_, *event)) ++skipped;
      } catch (const util::SerializationError& e) {
        throw util::SerializationError(stream_id, "event " + std::to_string(event->version) + " (" + event->type + "): " + e.what());
      }
      out->version = event->version;
    }

    if (out) LogRebuilt(stream_id, out->version, skipped);
    return out;
  }

 private:
  static void LogRebuilt(const std::string& stream_id, uint64_t version, uint64_t skipped);

  std::shared_ptr<const events::EventLog> log_;
  std::shared_ptr<const codec::Codec>     codec_;
};

} // namespace chronicle::aggregate

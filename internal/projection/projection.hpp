#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/events/recorded_event.hpp"

namespace chronicle::projection {

/*
  Inline projection: folds events into one document type.

  Per document the engine drives the state machine

    Absent --create rule--> Created --update rule--> Updated*

  Apply() returns the new encoded document, or nullopt when no rule
  matches the (document state, event type) pair.
*/
class Projection {
 public:
  virtual ~Projection() = default;

  virtual const std::string& DocumentType() const = 0;

  // Event type names this projection has any rule for.
  virtual std::vector<std::string> EventTypes() const = 0;

  // Document id the event targets. Defaults to the stream id.
  virtual std::string DocumentKey(const codec::Codec& codec, const events::RecordedEvent& event) const {
    (void)codec;
    return event.stream_id;
  }

  virtual std::optional<std::string> Apply(const codec::Codec& codec, const events::RecordedEvent& event,
                                           const std::optional<std::string>& current) const = 0;
};

} // namespace chronicle::projection

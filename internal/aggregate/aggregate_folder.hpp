#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/codec/codec.hpp"
#include "internal/events/recorded_event.hpp"

namespace chronicle::aggregate {

/*
  Event type -> state transition table for one aggregate type.

  Handlers take the state by value and return the next state. The key
  is the event's full message name, resolved when the handler is
  registered.
*/
template <typename TState>
class AggregateFolder {
 public:
  template <typename TEvent>
  AggregateFolder& On(std::function<TState(TState, const TEvent&)> fn) {
    handlers_[TEvent::descriptor()->full_name()] = [fn = std::move(fn)](TState state, const codec::Codec& codec,
                                                                         const events::RecordedEvent& e) {
      return fn(std::move(state), codec.DecodeAs<TEvent>(e.type, e.data));
    };
    return *this;
  }

  bool Handles(const std::string& event_type) const {
    return handlers_.contains(event_type);
  }

  // Unregistered event types leave the state unchanged; returns false for them.
  bool Fold(TState& state, const codec::Codec& codec, const events::RecordedEvent& event) const {
    const auto it = handlers_.find(event.type);
    if (it == handlers_.end()) return false;
    state = it->second(std::move(state), codec, event);
    return true;
  }

 private:
  using Handler = std::function<TState(TState, const codec::Codec&, const events::RecordedEvent&)>;

  std::unordered_map<std::string, Handler> handlers_;
};

} // namespace chronicle::aggregate

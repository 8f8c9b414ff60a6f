#pragma once

#include <functional>
#include <map>
#include <utility>

#include "internal/projection/projection.hpp"

namespace chronicle::projection {

/*
  Typed projection over protobuf document and event messages.

    DocumentProjection<AccountBalance> p;
    p.Create<AccountOpened>([](const AccountOpened& e) { ... })
     .Update<MoneyDeposited>([](AccountBalance doc, const MoneyDeposited& e) { ...; return doc; });

  Rules are keyed by the event's full message name when registered.
  Update rules take the current document by value and return the
  replacement.
*/
template <typename TDoc>
class DocumentProjection : public Projection {
 public:
  DocumentProjection() : document_type_(TDoc::descriptor()->full_name()) {
  }

  explicit DocumentProjection(std::string document_type) : document_type_(std::move(document_type)) {
  }

  template <typename TEvent>
  DocumentProjection& Create(std::function<TDoc(const TEvent&)> fn) {
    rules_[TEvent::descriptor()->full_name()].create = [fn = std::move(fn)](const codec::Codec& codec, const events::RecordedEvent& e) {
      return fn(codec.DecodeAs<TEvent>(e.type, e.data));
    };
    return *this;
  }

  template <typename TEvent>
  DocumentProjection& Update(std::function<TDoc(TDoc, const TEvent&)> fn) {
    rules_[TEvent::descriptor()->full_name()].update = [fn = std::move(fn)](TDoc doc, const codec::Codec& codec,
                                                                             const events::RecordedEvent& e) {
      return fn(std::move(doc), codec.DecodeAs<TEvent>(e.type, e.data));
    };
    return *this;
  }

  // Routes events of this type to a document other than the stream id.
  template <typename TEvent>
  DocumentProjection& Identity(std::function<std::string(const TEvent&)> fn) {
    rules_[TEvent::descriptor()->full_name()].identity = [fn = std::move(fn)](const codec::Codec& codec, const events::RecordedEvent& e) {
      return fn(codec.DecodeAs<TEvent>(e.type, e.data));
    };
    return *this;
  }

  const std::string& DocumentType() const override {
    return document_type_;
  }

  std::vector<std::string> EventTypes() const override {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& [type, _] : rules_) out.push_back(type);
    return out;
  }

  std::string DocumentKey(const codec::Codec& codec, const events::RecordedEvent& event) const override {
    const auto it = rules_.find(event.type);
    if (it == rules_.end() || !it->second.identity) return event.stream_id;
    return it->second.identity(codec, event);
  }

  std::optional<std::string> Apply(const codec::Codec& codec, const events::RecordedEvent& event,
                                   const std::optional<std::string>& current) const override {
    const auto it = rules_.find(event.type);
    if (it == rules_.end()) return std::nullopt;
    const auto& rules = it->second;

    if (!current.has_value()) {
      if (!rules.create) return std::nullopt;
      return codec.Encode(rules.create(codec, event)).data;
    }

    if (!rules.update) return std::nullopt;
    auto doc = codec.DecodeAs<TDoc>(TDoc::descriptor()->full_name(), *current);
    return codec.Encode(rules.update(std::move(doc), codec, event)).data;
  }

 private:
  struct Rules {
    std::function<TDoc(const codec::Codec&, const events::RecordedEvent&)>       create;
    std::function<TDoc(TDoc, const codec::Codec&, const events::RecordedEvent&)> update;
    std::function<std::string(const codec::Codec&, const events::RecordedEvent&)> identity;
  };

  std::string                  document_type_;
  std::map<std::string, Rules> rules_;
};

} // namespace chronicle::projection

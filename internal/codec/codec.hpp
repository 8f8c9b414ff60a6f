#pragma once

#include <memory>
#include <string>

#include <google/protobuf/message.h>

namespace chronicle::codec {

struct EncodedEvent {
  std::string type; // fully qualified message name
  std::string data;
};

/*
  Converts domain messages to and from the opaque payloads stored in the
  event and document tables.

  Implementations throw util::SerializationError on malformed payloads or
  when the stored type does not match the requested message.
*/
class Codec {
 public:
  virtual ~Codec() = default;

  virtual EncodedEvent Encode(const google::protobuf::Message& message) const = 0;

  virtual void DecodeInto(const std::string& type, const std::string& data, google::protobuf::Message* out) const = 0;

  // Type is resolved against the generated descriptor pool.
  virtual std::unique_ptr<google::protobuf::Message> Decode(const std::string& type, const std::string& data) const = 0;

  template <typename TMessage>
  TMessage DecodeAs(const std::string& type, const std::string& data) const {
    TMessage out;
    DecodeInto(type, data, &out);
    return out;
  }
};

} // namespace chronicle::codec

#pragma once

#include "internal/codec/codec.hpp"

namespace chronicle::codec {

/*
  Protobuf canonical JSON. Unknown fields in stored payloads are ignored
  so events written by newer builds still load.
*/
class JsonCodec final : public Codec {
 public:
  EncodedEvent Encode(const google::protobuf::Message& message) const override;

  void DecodeInto(const std::string& type, const std::string& data, google::protobuf::Message* out) const override;

  std::unique_ptr<google::protobuf::Message> Decode(const std::string& type, const std::string& data) const override;
};

} // namespace chronicle::codec

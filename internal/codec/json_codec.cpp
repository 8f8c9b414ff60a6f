#include "internal/codec/json_codec.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace chronicle::codec {

EncodedEvent JsonCodec::Encode(const google::protobuf::Message& message) const {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names   = true;
  options.always_print_primitive_fields = true; // zero values stay queryable

  EncodedEvent out;
  out.type = message.GetDescriptor()->full_name();

  const auto status = google::protobuf::util::MessageToJsonString(message, &out.data, options);
  if (!status.ok()) {
    throw util::SerializationError(out.type, "encode failed: " + status.ToString());
  }
  return out;
}

void JsonCodec::DecodeInto(const std::string& type, const std::string& data, google::protobuf::Message* out) const {
  const auto& expected = out->GetDescriptor()->full_name();
  if (type != expected) {
    throw util::SerializationError(type, "stored type " + type + " does not match " + expected);
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  out->Clear();
  const auto status = google::protobuf::util::JsonStringToMessage(data, out, options);
  if (!status.ok()) {
    throw util::SerializationError(type, "decode failed: " + status.ToString());
  }
}

std::unique_ptr<google::protobuf::Message> JsonCodec::Decode(const std::string& type, const std::string& data) const {
  const auto* descriptor = google::protobuf::DescriptorPool::generated_pool()->FindMessageTypeByName(type);
  if (descriptor == nullptr) {
    throw util::SerializationError(type, "unknown message type " + type);
  }

  const auto* prototype = google::protobuf::MessageFactory::generated_factory()->GetPrototype(descriptor);
  if (prototype == nullptr) {
    throw util::SerializationError(type, "no prototype for " + type);
  }

  std::unique_ptr<google::protobuf::Message> message(prototype->New());
  DecodeInto(type, data, message.get());
  return message;
}

} // namespace chronicle::codec

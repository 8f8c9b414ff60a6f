#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace chronicle::util {

/*
  Identifier helpers

  Random RFC4122 version 4 UUIDs rendered in canonical 8-4-4-4-12 form.
  Stream ids and document ids default to these; version tokens are
  always freshly generated so a token never repeats for a document.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Throws InvalidArgument unless text is 32 hex digits, dashes optional.
UUID FromString(std::string_view text);

std::string NewId();
std::string NewVersionToken();

} // namespace chronicle::util

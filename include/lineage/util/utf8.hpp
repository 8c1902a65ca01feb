#pragma once

#include <cstdint>
#include <string>

namespace lineage::util {

// True when every byte sequence in data is well-formed UTF-8
bool is_valid_utf8(const std::string& data);

// Reinterpret each byte as a Latin-1 code point and re-encode as UTF-8
std::string latin1_to_utf8(const std::string& data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Drop BOM and zero-width spaces, turn NBSP into a plain space
std::string strip_invisible(const std::string& text);

} // namespace lineage::util

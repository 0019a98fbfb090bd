#pragma once

#include <string>
#include <string_view>

namespace relay::util {

// Lowercase hex of raw bytes.
std::string ToHex(std::string_view bytes);

// Throws InvalidArgument on odd length or non-hex characters.
std::string FromHex(std::string_view hex);

int HexNibble(char c);

} // namespace relay::util

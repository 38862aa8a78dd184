#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cosmos {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(std::string s);

// True for the canonical 8-4-4-4-12 hexadecimal UUID text form
// (e.g. "9d49907c-a057-4f3b-9cfc-a6e2769b44cd"). Either letter case is accepted.
bool is_uuid(const std::string& s);

// Parses a base-10 integer made only of digits (no sign, no spaces).
// Returns false when the text is malformed or does not fit in int64.
bool parse_decimal_int64(std::string_view s, std::int64_t& out);

} // namespace cosmos

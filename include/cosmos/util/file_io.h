#pragma once

#include <string>

namespace cosmos {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// The data goes to a temporary sibling first and is then renamed over the
// target, so readers see either the old or the new contents, never a torn write.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

} // namespace cosmos

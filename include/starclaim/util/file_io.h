#pragma once

#include <string>

namespace starclaim {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// The contents go to a temporary sibling first and are renamed into place, so a
// crash mid-write never leaves a truncated file behind.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace starclaim

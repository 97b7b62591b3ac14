#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tissueseg {

// Throws InputError (NotFound / Unreadable).
std::vector<uint8_t> read_all(const std::string& path);

// Throws OutputError. Parent directories are not created.
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);
void write_text(const std::string& path, const std::string& text);

} // namespace tissueseg

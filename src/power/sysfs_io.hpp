// src/power/sysfs_io.hpp
#pragma once

#include <cstdint>
#include <string>

namespace power {

// Reads a whole attribute file and strips trailing whitespace.
bool read_trimmed(const std::string& path, std::string& out);

// Reads a decimal integer attribute. False on I/O or parse failure.
bool read_int64(const std::string& path, int64_t& out);

// Writes the string followed by a newline, as the kernel expects.
bool write_line(const std::string& path, const std::string& value);

} // namespace power

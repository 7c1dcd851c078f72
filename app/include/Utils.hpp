#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Utils {

std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
std::string capitalize(std::string value);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Strips characters that are unsafe in a folder name and collapses whitespace.
std::string sanitize_path_label(const std::string& value);

bool is_valid_utf8(const std::string& value);

std::string fnv1a_hex(const std::string& value);

// Random 128-bit hex identifier with an optional readable prefix.
std::string generate_id(const std::string& prefix = std::string());

std::string format_timestamp(TimePoint time_point);
std::optional<TimePoint> parse_timestamp(const std::string& value);

// Returns the directory used for config.ini, the database and logs.
std::string default_config_dir();

} // namespace Utils

#endif

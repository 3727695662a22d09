#pragma once

#include "toolexec/common/result.hpp"

#include <filesystem>
#include <string>

namespace toolexec::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Lowercase hex SHA-256 of the given bytes.
[[nodiscard]] std::string sha256_hex(const std::string &data);

/// Lowercase hex string of `bytes` cryptographically random bytes.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Current UTC time formatted as RFC 3339 with second precision.
[[nodiscard]] std::string now_rfc3339();

} // namespace toolexec::common

#pragma once

#include <string>
#include <string_view>

namespace loglens_core {

// Lowercase hex SHA-256 of the given bytes.
std::string compute_content_hash(std::string_view content);

}  // namespace loglens_core

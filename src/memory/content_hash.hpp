#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace memsync::memory {

// Text used for token estimation: strings verbatim, everything else
// compact JSON with sorted keys. Invalid UTF-8 is replaced rather than thrown.
std::string canonical_dump(const nlohmann::json& content);

// Hex SHA-256 of the compact JSON dump (strings quoted), so content of
// different shapes never shares a hash
std::string content_hash(const nlohmann::json& content);

} // namespace memsync::memory

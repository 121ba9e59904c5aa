#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "harbor/core/result.h"

namespace harbor::services {

constexpr const char* kDefaultMime = "application/octet-stream";

/// @brief Facts about staged bytes that are frozen into the file row at promotion.
struct ContentInfo {
    std::string mime;
    std::string hash;
    std::uint64_t size_bytes{0};
};

/// @brief Identify well-known formats from their leading bytes.
std::optional<std::string> SniffMime(const unsigned char* data, std::size_t size);
/// @brief Guess a MIME type from the extension of a declared file name.
std::optional<std::string> GuessMimeFromName(const std::string& name);

/// @brief Read the file at `path` once, hashing it (SHA-256 hex) and resolving its MIME type.
///
/// The declared MIME wins when present; otherwise content sniffing, then the
/// extension of `name`, then application/octet-stream.
core::Result<ContentInfo> InspectContent(const std::string& path, const std::string& name,
                                         const std::optional<std::string>& declared_mime);

}  // namespace harbor::services

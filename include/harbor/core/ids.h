#pragma once

#include <string>

namespace harbor::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate the id shared by a staging upload and the file it is promoted to.
std::string GenerateObjectId();
/// @brief True if `value` is a canonical lower-case UUID as produced by GenerateObjectId.
bool IsObjectId(const std::string& value);

}  // namespace harbor::core

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/beast/http/status.hpp>

#include "harbor/core/error.h"
#include "harbor/http/router.h"
#include "harbor/metadata/metadata_store.h"

namespace harbor::http {

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body);
/// @brief Consistent error envelope: {"error":{"code","message","request_id"}}.
HttpResponse JsonError(boost::beast::http::status status, int version, const std::string& code,
                       const std::string& message, const std::string& request_id);
/// @brief Error envelope for a service error, with the status derived from its code.
HttpResponse ErrorFor(const core::Error& error, int version, const std::string& request_id);

/// @brief HTTP status for a service error. Rejected offsets map to 422.
boost::beast::http::status StatusFor(core::ErrorCode code);

std::string StagingFileJson(const metadata::StagingFile& file);
std::string FileJson(const metadata::FileRecord& file);

/// @brief Parse the `offset` query value; empty means 0, anything but digits is rejected.
std::optional<std::uint64_t> ParseOffset(const std::string& value);

std::string GetQueryParam(const std::string& target, const std::string& key);
std::string StripQuery(const std::string& target);

}  // namespace harbor::http

#pragma once

#include <memory>

#include "harbor/http/router.h"

namespace harbor::services {
class FileService;
class StagingFileService;
}  // namespace harbor::services

namespace harbor::http {

/// Registers the server's HTTP routes into the provided router.
///
/// Chunk uploads and file content downloads are streamed by the server itself
/// and are not part of the route table; see HttpServer. Handlers that find a
/// staging row busy return the kBusy error unrendered so the server can retry
/// the request once the row is free.
void RegisterDefaultRoutes(Router& router,
                           std::shared_ptr<services::StagingFileService> staging,
                           std::shared_ptr<services::FileService> files);

}  // namespace harbor::http

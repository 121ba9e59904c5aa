#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "harbor/core/config.h"
#include "harbor/http/router.h"
#include "harbor/services/file_service.h"
#include "harbor/services/staging_file_service.h"

namespace harbor::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
///
/// Requests go through the router, except two the server streams itself so
/// that no object is ever buffered whole: `PUT /v1/staging-files/{id}` writes
/// request body pieces straight into the staging file, and
/// `GET /v1/files/{id}/content` reads ranges from the file driver. Requests
/// that find their staging row busy are retried on a timer until
/// `storage.lock_wait_ms` runs out, without blocking an io thread.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<services::StagingFileService> staging,
               std::shared_ptr<services::FileService> files);
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<services::StagingFileService> staging_;
    std::shared_ptr<services::FileService> files_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace harbor::http

#include "harbor/http/http_server.h"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "harbor/core/ids.h"
#include "harbor/core/logger.h"
#include "harbor/http/object_body.h"
#include "harbor/http/responses.h"
#include "harbor/observability/metrics.h"
#include "harbor/storage/byte_range.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kContentRoute = "/v1/files/{id}/content";
constexpr const char* kStagingFileRoute = "/v1/staging-files/{id}";
constexpr auto kBusyRetryInterval = std::chrono::milliseconds(20);

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, harbor::http::Router router, harbor::core::Config config,
            std::shared_ptr<harbor::services::StagingFileService> staging,
            std::shared_ptr<harbor::services::FileService> files)
        : stream_(std::move(stream)),
          retry_timer_(stream_.get_executor()),
          router_(std::move(router)),
          config_(std::move(config)),
          staging_(std::move(staging)),
          files_(std::move(files)) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            harbor::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }

        request_id_ = harbor::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        busy_deadline_ =
            request_start_ + std::chrono::milliseconds(config_.storage.lock_wait_ms);

        if (ec == http::error::body_limit) {
            // A declared Content-Length over the limit is refused before any byte is read.
            return Send(PayloadTooLarge());
        }
        if (ec) {
            harbor::core::LogError("Read header failed: " + ec.message());
            return;
        }

        harbor::http::RouteParams params;
        if (parser_->get().method() == http::verb::put &&
            harbor::http::Router::Match(kStagingFileRoute,
                                        harbor::http::StripQuery(request_target_), &params)) {
            return StartFill(params);
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return Send(PayloadTooLarge());
        }
        if (ec && ec != http::error::need_buffer) {
            harbor::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    // Chunk uploads bypass the router: pieces go to the staging file as they
    // arrive, under the upload's lease, instead of being buffered first.
    void StartFill(harbor::http::RouteParams& params) {
        BuildRequest(std::string());
        if (auto rejected = router_.Intercept(ctx_, request_, params)) {
            return Send(std::move(*rejected));
        }
        const auto offset = harbor::http::ParseOffset(
            harbor::http::GetQueryParam(request_target_, "offset"));
        if (!offset) {
            return Send(harbor::http::JsonError(http::status::bad_request, request_.version(),
                                                "INVALID_ARGUMENT",
                                                "offset must be a non-negative integer",
                                                request_id_));
        }
        fill_id_ = params["id"];
        fill_offset_ = *offset;
        BeginFill();
    }

    void BeginFill() {
        auto begun = staging_->BeginFill(fill_id_, fill_offset_,
                                         harbor::services::LeaseWait::kNoWait);
        if (!begun.ok()) {
            if (begun.error().code == harbor::core::ErrorCode::kBusy &&
                RetryWhileBusy(&Session::BeginFill)) {
                return;
            }
            return Send(harbor::http::ErrorFor(begun.error(), request_.version(), request_id_));
        }
        fill_.emplace(std::move(begun.value()));
        if (parser_->is_done()) {
            return FinishFill();
        }
        DoReadFillChunk();
    }

    void DoReadFillChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnFillChunk,
                                                   this->shared_from_this()));
    }

    void OnFillChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            fill_.reset();
            return Send(PayloadTooLarge());
        }
        if (ec && ec != http::error::need_buffer) {
            harbor::core::LogError("Read chunk for staging file " + fill_id_ +
                                   " failed: " + ec.message());
            fill_.reset();
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        if (bytes > 0) {
            auto appended = fill_->Append(body_buffer_.data(), bytes);
            if (!appended.ok()) {
                fill_.reset();
                return Send(
                    harbor::http::ErrorFor(appended.error(), request_.version(), request_id_));
            }
        }
        if (parser_->is_done()) {
            return FinishFill();
        }
        DoReadFillChunk();
    }

    void FinishFill() {
        auto committed = fill_->Commit();
        fill_.reset();
        if (!committed.ok()) {
            return Send(
                harbor::http::ErrorFor(committed.error(), request_.version(), request_id_),
                request_.keep_alive());
        }
        Send(harbor::http::JsonResponse(http::status::ok, request_.version(),
                                        harbor::http::StagingFileJson(committed.value())),
             request_.keep_alive());
    }

    void HandleRequest() {
        BuildRequest(std::move(body_));
        body_.clear();

        const auto path = harbor::http::StripQuery(ctx_.target);
        harbor::http::RouteParams params;
        if (request_.method() == http::verb::get &&
            harbor::http::Router::Match(kContentRoute, path, &params)) {
            return HandleDownload(params);
        }
        Dispatch();
    }

    void Dispatch() {
        auto result = router_.Route(ctx_, request_);
        if (!result.ok()) {
            if (result.error().code == harbor::core::ErrorCode::kBusy &&
                RetryWhileBusy(&Session::Dispatch)) {
                return;
            }
            auto response = harbor::http::ErrorFor(result.error(), request_.version(),
                                                   request_id_);
            return Send(std::move(response), request_.keep_alive());
        }
        Send(std::move(result.value()), request_.keep_alive());
    }

    // Runs `step` again on this session's strand after a short pause, so a busy
    // staging row never parks an io thread. False once storage.lock_wait_ms is spent.
    bool RetryWhileBusy(void (Session::*step)()) {
        if (std::chrono::steady_clock::now() >= busy_deadline_) {
            return false;
        }
        retry_timer_.expires_after(kBusyRetryInterval);
        retry_timer_.async_wait([self = this->shared_from_this(), step](beast::error_code ec) {
            if (!ec) {
                ((*self).*step)();
            }
        });
        return true;
    }

    // Convert the buffer_body parser's header into a string_body request for the router.
    void BuildRequest(std::string body) {
        request_ = harbor::http::HttpRequest{};
        request_.method(parser_->get().method());
        request_.target(parser_->get().target());
        request_.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request_.set(field.name_string(), field.value());
        }
        request_.body() = std::move(body);
        request_.prepare_payload();
        request_.keep_alive(parser_->get().keep_alive());

        ctx_ = harbor::http::RequestContext{};
        ctx_.request_id = request_id_;
        ctx_.method = request_method_;
        ctx_.target = request_target_;
        ctx_.remote = request_remote_;
    }

    void HandleDownload(harbor::http::RouteParams& params) {
        const bool keep_alive = request_.keep_alive();
        if (auto rejected = router_.Intercept(ctx_, request_, params)) {
            return Send(std::move(*rejected), keep_alive);
        }
        const auto id = params["id"];
        const auto version = request_.version();

        auto file = files_->Get(id);
        if (!file.ok()) {
            return Send(harbor::http::ErrorFor(file.error(), version, request_id_), keep_alive);
        }
        const auto size = file.value().size_bytes;

        // Support HTTP Range for large object reads and resumable downloads.
        auto range =
            harbor::storage::ParseRangeHeader(std::string(request_[http::field::range]));
        if (!range.ok()) {
            return Send(RangeNotSatisfiable(version, range.error().message, size), keep_alive);
        }

        auto reader = files_->Read(id, range.value());
        if (!reader.ok()) {
            const auto code = reader.error().code;
            if (code == harbor::core::ErrorCode::kOutOfRange ||
                code == harbor::core::ErrorCode::kInvalidArgument) {
                return Send(RangeNotSatisfiable(version, reader.error().message, size),
                            keep_alive);
            }
            return Send(harbor::http::ErrorFor(reader.error(), version, request_id_),
                        keep_alive);
        }

        const auto offset = reader.value().offset();
        const auto length = reader.value().length();
        const bool partial = !range.value().IsFull() && length > 0;

        http::response<harbor::http::ObjectBody> response{
            partial ? http::status::partial_content : http::status::ok, version};
        response.set(http::field::content_type, file.value().mime);
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::etag, "\"" + file.value().hash + "\"");
        if (partial) {
            response.set(http::field::content_range,
                         "bytes " + std::to_string(offset) + "-" +
                             std::to_string(offset + length - 1) + "/" +
                             std::to_string(reader.value().file_size()));
        }
        response.body() = std::move(reader.value());
        response.prepare_payload();
        Send(std::move(response), keep_alive);
    }

    harbor::http::HttpResponse RangeNotSatisfiable(int version, const std::string& message,
                                                   std::uint64_t size) {
        auto response = harbor::http::JsonError(http::status::range_not_satisfiable, version,
                                                "INVALID_RANGE", message, request_id_);
        response.set(http::field::content_range, "bytes */" + std::to_string(size));
        response.set(http::field::accept_ranges, "bytes");
        return response;
    }

    harbor::http::HttpResponse PayloadTooLarge() {
        return harbor::http::JsonError(
            http::status::payload_too_large, parser_->get().version(), "PAYLOAD_TOO_LARGE",
            "chunk exceeds " + std::to_string(config_.server.limits.max_body_bytes) + " bytes",
            request_id_);
    }

    template <typename Body>
    void Send(http::response<Body>&& response, bool keep_alive = false) {
        response.set(http::field::server, "Harbor");
        response.set("X-Request-Id", request_id_);
        if (!keep_alive) {
            response.keep_alive(false);
        }
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        harbor::core::LogRequest(request_id_, request_method_, request_target_, request_remote_,
                                 response.result_int(), latency);
        harbor::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            harbor::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    net::steady_timer retry_timer_;

    harbor::http::Router router_;
    harbor::core::Config config_;
    std::shared_ptr<harbor::services::StagingFileService> staging_;
    std::shared_ptr<harbor::services::FileService> files_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::chrono::steady_clock::time_point busy_deadline_{};
    std::string body_;
    harbor::http::HttpRequest request_;
    harbor::http::RequestContext ctx_;

    std::string fill_id_;
    std::uint64_t fill_offset_{0};
    std::optional<harbor::services::StagingFill> fill_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, harbor::http::Router router,
             harbor::core::Config config,
             std::shared_ptr<harbor::services::StagingFileService> staging,
             std::shared_ptr<harbor::services::FileService> files, net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          staging_(std::move(staging)),
          files_(std::move(files)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw beast::system_error(ec);
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(acceptor_.get_executor()),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            harbor::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, staging_, files_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             staging_, files_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    harbor::http::Router router_;
    harbor::core::Config config_;
    std::shared_ptr<harbor::services::StagingFileService> staging_;
    std::shared_ptr<harbor::services::FileService> files_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace harbor::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<services::StagingFileService> staging,
                       std::shared_ptr<services::FileService> files)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      staging_(std::move(staging)),
      files_(std::move(files)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, staging_, files_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
    core::LogInfo("Listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port) +
                  (ssl_context_ ? " (TLS)" : ""));
}

}  // namespace harbor::http

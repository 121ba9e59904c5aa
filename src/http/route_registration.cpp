#include "harbor/http/route_registration.h"

#include <optional>
#include <string>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "harbor/core/ids.h"
#include "harbor/http/responses.h"
#include "harbor/observability/metrics.h"
#include "harbor/services/file_service.h"
#include "harbor/services/staging_file_service.h"

namespace harbor::http {
namespace {

namespace beast_http = boost::beast::http;

HttpResponse NoContent(int version) {
    HttpResponse response{beast_http::status::no_content, version};
    response.prepare_payload();
    return response;
}

}  // namespace

void RegisterDefaultRoutes(Router& router,
                           std::shared_ptr<services::StagingFileService> staging,
                           std::shared_ptr<services::FileService> files) {
    // Ids name files on disk, so anything that is not one of ours cannot exist.
    router.Use([](RequestContext& ctx, HttpRequest& req,
                  RouteParams& params) -> std::optional<HttpResponse> {
        auto it = params.find("id");
        if (it == params.end() || core::IsObjectId(it->second)) {
            return std::nullopt;
        }
        return JsonError(beast_http::status::not_found, req.version(), "NOT_FOUND",
                         "unknown id", ctx.request_id);
    });

    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ok\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ready\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain; version=0.0.4");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/v1/staging-files",
               [staging](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   std::string name;
                   std::optional<std::string> mime;
                   try {
                       Poco::JSON::Parser parser;
                       auto result = parser.parse(req.body());
                       auto obj = result.extract<Poco::JSON::Object::Ptr>();
                       name = obj->optValue<std::string>("name", "");
                       if (obj->has("mime") && !obj->isNull("mime")) {
                           mime = obj->getValue<std::string>("mime");
                       }
                   } catch (const Poco::Exception& ex) {
                       return JsonError(beast_http::status::bad_request, req.version(),
                                        "INVALID_JSON", ex.displayText(), ctx.request_id);
                   }

                   auto created = staging->Create(name, mime);
                   if (!created.ok()) {
                       return ErrorFor(created.error(), req.version(), ctx.request_id);
                   }
                   return JsonResponse(beast_http::status::created, req.version(),
                                       StagingFileJson(created.value()));
               });

    router.Add("GET", "/v1/staging-files/{id}",
               [staging](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto file = staging->Get(params.at("id"));
                   if (!file.ok()) {
                       return ErrorFor(file.error(), req.version(), ctx.request_id);
                   }
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       StagingFileJson(file.value()));
               });

    router.Add("DELETE", "/v1/staging-files/{id}",
               [staging](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) -> core::Result<HttpResponse> {
                   auto removed =
                       staging->Remove(params.at("id"), true, services::LeaseWait::kNoWait);
                   if (!removed.ok()) {
                       if (removed.error().code == core::ErrorCode::kBusy) {
                           return removed.error();
                       }
                       return ErrorFor(removed.error(), req.version(), ctx.request_id);
                   }
                   return NoContent(req.version());
               });

    router.Add("POST", "/v1/staging-files/{id}/promote",
               [files](const RequestContext& ctx, const HttpRequest& req,
                       const RouteParams& params) -> core::Result<HttpResponse> {
                   auto promoted = files->Promote(params.at("id"), services::LeaseWait::kNoWait);
                   if (!promoted.ok()) {
                       if (promoted.error().code == core::ErrorCode::kBusy) {
                           return promoted.error();
                       }
                       return ErrorFor(promoted.error(), req.version(), ctx.request_id);
                   }
                   return JsonResponse(beast_http::status::created, req.version(),
                                       FileJson(promoted.value()));
               });

    router.Add("GET", "/v1/files/{id}",
               [files](const RequestContext& ctx, const HttpRequest& req,
                       const RouteParams& params) {
                   auto file = files->Get(params.at("id"));
                   if (!file.ok()) {
                       return ErrorFor(file.error(), req.version(), ctx.request_id);
                   }
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       FileJson(file.value()));
               });

    router.Add("DELETE", "/v1/files/{id}",
               [files](const RequestContext& ctx, const HttpRequest& req,
                       const RouteParams& params) {
                   auto removed = files->Remove(params.at("id"));
                   if (!removed.ok()) {
                       return ErrorFor(removed.error(), req.version(), ctx.request_id);
                   }
                   return NoContent(req.version());
               });
}

}  // namespace harbor::http

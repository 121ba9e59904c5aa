#include "harbor/http/router.h"

#include <sstream>
#include <utility>

namespace harbor::http {

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, pattern, std::move(handler)});
}

void Router::Use(Middleware middleware) { middleware_.push_back(std::move(middleware)); }

std::optional<HttpResponse> Router::Intercept(RequestContext& ctx, HttpRequest& request,
                                              RouteParams& params) const {
    for (const auto& middleware : middleware_) {
        auto maybe_response = middleware(ctx, request, params);
        if (maybe_response) {
            return maybe_response;
        }
    }
    return std::nullopt;
}

core::Result<HttpResponse> Router::Route(RequestContext& ctx, HttpRequest& request) const {
    const auto target = std::string(request.target());
    const auto path = target.substr(0, target.find('?'));
    bool path_matched = false;

    for (const auto& route : routes_) {
        RouteParams params;
        if (!Match(route.pattern, path, &params)) {
            continue;
        }
        path_matched = true;
        if (route.method != request.method_string()) {
            continue;
        }
        auto maybe_response = Intercept(ctx, request, params);
        if (maybe_response) {
            return std::move(*maybe_response);
        }
        return route.handler(ctx, request, params);
    }

    const auto status = path_matched ? boost::beast::http::status::method_not_allowed
                                     : boost::beast::http::status::not_found;
    HttpResponse response{status, request.version()};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() =
        std::string("{\"error\":{\"code\":\"") +
        (path_matched ? "METHOD_NOT_ALLOWED" : "NOT_FOUND") + "\",\"message\":\"" +
        (path_matched ? "method not allowed" : "route not found") +
        "\",\"request_id\":\"" + ctx.request_id + "\"}}";
    response.prepare_payload();
    return response;
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    auto pattern_parts = SplitPath(pattern);
    auto path_parts = SplitPath(path);
    if (pattern_parts.size() != path_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& p = pattern_parts[i];
        const auto& v = path_parts[i];
        if (p.size() >= 2 && p.front() == '{' && p.back() == '}') {
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 2)] = v;
            }
        } else if (p != v) {
            return false;
        }
    }
    return true;
}

}  // namespace harbor::http

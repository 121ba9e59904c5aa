#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "harbor/core/result.h"
#include "harbor/http/request_context.h"

namespace harbor::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&, const RouteParams&)>;
using Middleware = std::function<std::optional<HttpResponse>(RequestContext&, HttpRequest&, RouteParams&)>;

/// @brief Simple route table with path-template matching.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    /// @brief Run `middleware` before every matched handler; a returned response short-circuits.
    void Use(Middleware middleware);
    /// @brief Dispatch `request`; middleware may rewrite `ctx` and `request` in place.
    core::Result<HttpResponse> Route(RequestContext& ctx, HttpRequest& request) const;
    /// @brief Run the middleware chain alone, for requests served outside the route table.
    std::optional<HttpResponse> Intercept(RequestContext& ctx, HttpRequest& request,
                                          RouteParams& params) const;

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    struct RouteEntry {
        std::string method;
        std::string pattern;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);

    std::vector<RouteEntry> routes_;
    std::vector<Middleware> middleware_;
};

}  // namespace harbor::http

#include "harbor/http/responses.h"

#include <cctype>
#include <limits>
#include <sstream>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Object.h>

namespace harbor::http {

namespace http = boost::beast::http;

namespace {

std::string Stringify(const Poco::JSON::Object& object) {
    std::stringstream ss;
    object.stringify(ss);
    return ss.str();
}

}  // namespace

HttpResponse JsonResponse(http::status status, int version, const std::string& body) {
    HttpResponse response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(http::status status, int version, const std::string& code,
                       const std::string& message, const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    return JsonResponse(status, version, Stringify(root));
}

HttpResponse ErrorFor(const core::Error& error, int version, const std::string& request_id) {
    return JsonError(StatusFor(error.code), version, core::ErrorCodeName(error.code),
                     error.message, request_id);
}

http::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return http::status::ok;
        case core::ErrorCode::kInvalidArgument:
            return http::status::bad_request;
        case core::ErrorCode::kNotFound:
            return http::status::not_found;
        case core::ErrorCode::kAlreadyExists:
        case core::ErrorCode::kConflict:
        case core::ErrorCode::kBusy:
        case core::ErrorCode::kNotYetFilled:
            return http::status::conflict;
        case core::ErrorCode::kOutOfRange:
            return http::status::unprocessable_entity;
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            break;
    }
    return http::status::internal_server_error;
}

std::string StagingFileJson(const metadata::StagingFile& file) {
    Poco::JSON::Object obj;
    obj.set("id", file.id);
    obj.set("name", file.name);
    if (file.mime) {
        obj.set("mime", *file.mime);
    } else {
        obj.set("mime", Poco::Dynamic::Var());
    }
    obj.set("size", static_cast<Poco::UInt64>(file.size_bytes));
    obj.set("staged_at", file.staged_at);
    return Stringify(obj);
}

std::string FileJson(const metadata::FileRecord& file) {
    Poco::JSON::Object obj;
    obj.set("id", file.id);
    obj.set("name", file.name);
    obj.set("mime", file.mime);
    obj.set("size", static_cast<Poco::UInt64>(file.size_bytes));
    obj.set("hash", file.hash);
    obj.set("created_at", file.created_at);
    return Stringify(obj);
}

std::optional<std::uint64_t> ParseOffset(const std::string& value) {
    if (value.empty()) {
        return std::uint64_t{0};
    }
    std::uint64_t parsed = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (parsed > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        parsed = parsed * 10 + digit;
    }
    return parsed;
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

}  // namespace harbor::http

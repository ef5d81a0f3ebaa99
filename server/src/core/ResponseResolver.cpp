#include "core/ResponseResolver.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/ContentType.hpp"
#include "core/Errors.hpp"
#include "utils/KeyValue.hpp"
#include "utils/Utf8.hpp"

namespace fs = std::filesystem;

static const char* const kPathNotFound = "Path not found";
static const char* const kMethodNotAllowed = "Method Not Allowed";

static std::string readWholeFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ConfigFileOpenError(path);
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw IoError("cannot open " + path);
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        throw IoError("read failed for " + path);
    }
    return ss.str();
}

std::string toString(Outcome o) {
    switch (o) {
        case Outcome::Matched:            return "matched";
        case Outcome::NoRoute:            return "no_route";
        case Outcome::MethodMismatch:     return "method_mismatch";
        case Outcome::BadMethod:          return "bad_method";
        case Outcome::PreconditionFailed: return "precondition_failed";
        case Outcome::BodySourceError:    return "body_source_error";
    }
    return "matched";
}

ResponseResolver::ResponseResolver(RouteTable routes, ResolverMode mode)
    : routes_(std::move(routes)), mode_(mode) {
    if (!routes_) {
        routes_ = makeRouteTable({});
    }
}

const RouteEntry* ResponseResolver::match(const std::string& uri) const {
    for (const auto& entry : *routes_) {
        if (entry.path == uri) return &entry;
    }
    return nullptr;
}

std::optional<Method> ResponseResolver::effectiveMethod(const Request& req) const {
    if (req.method) return req.method;
    if (mode_ == ResolverMode::Legacy) return Method::GET;
    return std::nullopt;
}

void ResponseResolver::checkPreconditions(const RouteEntry& entry, const Request& req) const {
    if (entry.headers) {
        for (const auto& name : *entry.headers) {
            if (req.headers.find(name) == req.headers.end()) {
                throw ConfigRequiredHeadersError(name);
            }
        }
    }

    if (entry.queries) {
        for (const auto& name : *entry.queries) {
            if (req.queryStrings.find(name) == req.queryStrings.end()) {
                throw ConfigRequiredQueriesError(name);
            }
        }
    }
}

Response ResponseResolver::materialize(const RouteEntry& entry, const Request& req) const {
    Response res;
    res.status = entry.statusCode ? Status::from(*entry.statusCode) : Status::ok();

    switch (entry.resultType) {
        case ResultType::Direct:
            res.body = entry.result;
            break;

        case ResultType::File:
            res.body = readWholeFile(entry.result);
            if (!isValidUtf8(res.body)) {
                throw IoError("stream did not contain valid UTF-8: " + entry.result);
            }
            break;

        case ResultType::Download:
            res.body = readWholeFile(entry.result);
            res.headers["Content-Type"] = mimeTypeForExtension(extensionOf(entry.result));
            res.headers["Accept-Ranges"] = "None";
            res.headers["Content-Disposition"] = "attachment; filename=" + baseNameOf(entry.result);
            break;

        case ResultType::Unknown:
            break;
    }

    res.headers["Content-Length"] = std::to_string(res.body.size());

    auto host = req.headers.find("Host");
    if (host != req.headers.end()) {
        res.headers["Host"] = host->second;
    }

    // config-declared headers go last and win
    if (entry.resultHeaders) {
        for (const auto& item : *entry.resultHeaders) {
            std::pair<std::string, std::string> kv;
            try {
                kv = splitKeyValue(item, ':');
            } catch (const ParsingError&) {
                throw ConfigParsingError("result header `" + item + "` on " + entry.path);
            }
            res.headers[kv.first] = kv.second;
        }
    }

    return res;
}

Response ResponseResolver::resolve(const Request& req) const {
    const RouteEntry* entry = match(req.uri);
    if (!entry) {
        return Response(Status::notFound(), kPathNotFound);
    }

    auto method = effectiveMethod(req);
    if (!method) {
        return Response(Status::badRequest(), "Unsupported method: " + req.methodToken);
    }
    if (*method != entry->method) {
        return Response(Status::methodNotAllowed(), kMethodNotAllowed);
    }

    checkPreconditions(*entry, req);
    return materialize(*entry, req);
}

Resolution ResponseResolver::evaluate(const Request& req) const {
    const RouteEntry* entry = match(req.uri);
    if (!entry) {
        return {Outcome::NoRoute, Response(Status::notFound(), kPathNotFound),
                "no route for " + req.uri};
    }

    auto method = effectiveMethod(req);
    if (!method) {
        return {Outcome::BadMethod,
                Response(Status::badRequest(), "Unsupported method: " + req.methodToken),
                "unrecognized method `" + req.methodToken + "`"};
    }
    if (*method != entry->method) {
        return {Outcome::MethodMismatch, Response(Status::methodNotAllowed(), kMethodNotAllowed),
                toString(*method) + " on a " + toString(entry->method) + " route"};
    }

    try {
        checkPreconditions(*entry, req);
    } catch (const ConfigRequiredHeadersError& e) {
        return {Outcome::PreconditionFailed, Response(Status::badRequest(), e.what()), e.what()};
    } catch (const ConfigRequiredQueriesError& e) {
        return {Outcome::PreconditionFailed, Response(Status::badRequest(), e.what()), e.what()};
    }

    try {
        return {Outcome::Matched, materialize(*entry, req), ""};
    } catch (const FakeRestError& e) {
        return {Outcome::BodySourceError,
                Response(Status::internalServerError(), "Internal Server Error"), e.what()};
    }
}

#pragma once
#include <string>

#include "core/Request.hpp"
#include "core/Response.hpp"
#include "core/RouteTable.hpp"

enum class ResolverMode {
    Legacy,  // unknown methods act as GET, route errors abort the connection
    Strict   // unknown methods get 400, route errors become 400/500 responses
};

enum class Outcome {
    Matched,
    NoRoute,
    MethodMismatch,
    BadMethod,
    PreconditionFailed,
    BodySourceError
};

std::string toString(Outcome o);

struct Resolution {
    Outcome     outcome = Outcome::Matched;
    Response    response;
    std::string reason;  // empty for Matched
};

class ResponseResolver {
public:
    explicit ResponseResolver(RouteTable routes, ResolverMode mode = ResolverMode::Legacy);

    // Match, check and materialize. Throws ConfigRequiredHeadersError,
    // ConfigRequiredQueriesError, ConfigFileOpenError, ConfigParsingError or IoError.
    Response resolve(const Request& req) const;

    // Same steps, but every route-level failure comes back as a well formed
    // response tagged with what went wrong.
    Resolution evaluate(const Request& req) const;

    ResolverMode mode() const { return mode_; }
    const RouteTable& routes() const { return routes_; }

private:
    // First entry whose path equals `uri`, nullptr if none.
    const RouteEntry* match(const std::string& uri) const;

    // Request method after applying the mode's policy for unknown tokens.
    std::optional<Method> effectiveMethod(const Request& req) const;

    void checkPreconditions(const RouteEntry& entry, const Request& req) const;
    Response materialize(const RouteEntry& entry, const Request& req) const;

    RouteTable   routes_;
    ResolverMode mode_;
};

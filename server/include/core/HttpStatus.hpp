#pragma once
#include <string>

struct Status {
    int code = 200;
    std::string message = "OK";

    static Status ok()                  { return {200, "OK"}; }
    static Status created()             { return {201, "Created"}; }
    static Status badRequest()          { return {400, "Bad Request"}; }
    static Status unauthorized()        { return {401, "Unauthorized"}; }
    static Status paymentRequired()     { return {402, "Payment Required"}; }
    static Status forbidden()           { return {403, "Forbidden"}; }
    static Status notFound()            { return {404, "Not Found"}; }
    static Status methodNotAllowed()    { return {405, "Method Not Allowed"}; }
    static Status notAcceptable()       { return {406, "Not Acceptable"}; }
    static Status unprocessableEntity() { return {422, "Unprocessable Entity"}; }
    static Status internalServerError() { return {500, "Internal Server Error"}; }

    // Codes outside the table above fall back to 200 OK.
    static Status from(int code);
};

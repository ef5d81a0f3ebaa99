#include "core/HttpStatus.hpp"

Status Status::from(int code) {
    switch (code) {
        case 200: return ok();
        case 201: return created();
        case 400: return badRequest();
        case 401: return unauthorized();
        case 402: return paymentRequired();
        case 403: return forbidden();
        case 404: return notFound();
        case 405: return methodNotAllowed();
        case 406: return notAcceptable();
        case 422: return unprocessableEntity();
        case 500: return internalServerError();
        default:  return ok();
    }
}

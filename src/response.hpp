#pragma once

#include "errors.hpp"
#include "util.hpp"

#include <optional>
#include <string>

namespace restcall {

/// Fully drained HTTP response of one successful attempt.
struct Response {
    unsigned int statusCode = 0;
    Values       headers;   // names as received
    std::string  body;

    /// First value of header @p name (case-insensitive), or "" if absent.
    std::string header(const std::string& name) const;
};

/// Result of RequestBuilder::send(): the last attempt's response or error.
/// Exactly one of the two is engaged.
struct Outcome {
    std::optional<Response>     response;
    std::optional<RequestError> error;

    bool ok() const { return response.has_value(); }
};

} // namespace restcall

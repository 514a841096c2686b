#pragma once

#include "util.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace restcall {

/// Fully assembled request handed to a Transport for one attempt.
struct TransportRequest {
    std::string method;
    UrlParts    url;           // query already encoded into url.query
    std::string absoluteUrl;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{0};
};

/// Streaming response payload. Destroying the reader closes the stream.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    /// Append the next chunk to @p out.  Returns false once the body is
    /// exhausted.
    /// @throws std::exception if the payload cannot be read.
    virtual bool readSome(std::string& out) = 0;
};

struct TransportResponse {
    unsigned int                statusCode = 0;
    Values                      headers;
    std::unique_ptr<BodyReader> body;
};

/// External HTTP engine: connection, TLS and framing live behind this seam.
class Transport {
public:
    Transport() = default;
    virtual ~Transport() = default;
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /// Perform the round trip up to the response header.
    /// @throws std::exception on network / timeout / protocol errors.
    virtual TransportResponse roundTrip(const TransportRequest& request) = 0;
};

} // namespace restcall

#pragma once

#include <stdexcept>
#include <string>

namespace restcall {

/// Stage of a request that failed.
enum class ErrorKind {
    UrlParse,   // malformed URL; never retried
    Transport,  // connect / DNS / TLS / write / header read / timeout
    Read,       // response header arrived but the body could not be drained
};

const char* toString(ErrorKind kind);

/// Failure of one attempt, labelled with the stage that failed.
/// what() reads "<label>: <cause>", e.g. "transport failed: Connection refused".
class RequestError : public std::runtime_error {
public:
    RequestError(ErrorKind kind, const std::string& cause);

    ErrorKind          kind()  const { return mKind; }
    const std::string& cause() const { return mCause; }

private:
    ErrorKind   mKind;
    std::string mCause;
};

} // namespace restcall

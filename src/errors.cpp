#include "errors.hpp"

namespace restcall {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UrlParse:  return "URL parse failed";
    case ErrorKind::Transport: return "transport failed";
    case ErrorKind::Read:      return "read failed";
    }
    return "request failed";
}

RequestError::RequestError(ErrorKind kind, const std::string& cause)
    : std::runtime_error(std::string(toString(kind)) + ": " + cause)
    , mKind(kind)
    , mCause(cause) {}

} // namespace restcall

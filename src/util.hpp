#pragma once

#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace restcall {

/// Multi-valued string map used for query strings, headers and form fields.
/// Keys iterate in sorted order; values keep insertion order.
using Values = std::map<std::string, std::vector<std::string>>;

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;     // lower-cased, e.g. "http"
    std::string userinfo;   // raw "user[:password]" before '@', if any
    std::string authority;  // host[:port] as written, without userinfo
    std::string host;       // brackets stripped for IPv6 literals
    std::string port;       // "80", "443", "4000", etc.
    std::string target;     // path component (e.g. "/items")
    std::string query;      // raw query string, without '?'
    std::string fragment;   // without '#', never sent on the wire
};

/// Parse an absolute URL into its components.
/// Percent escapes are validated in the userinfo and the path. The query is
/// kept raw and unchecked.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Rebuild the absolute request URL (fragment omitted).
std::string formatUrl(const UrlParts& parts);

/// Decode %XX escapes. '+' is left as is. Escapes must already be valid.
std::string percentDecode(const std::string& text);

/// Escape one query or form component ("a b&c" -> "a+b%26c").
std::string queryEscape(const std::string& text);

/// Encode values as "k=v&k=v2&z=1", keys sorted, values in insertion order.
std::string encodeValues(const Values& values);

/// ASCII case-insensitive comparison, as used for header names.
bool equalsIgnoreCase(const std::string& a, const std::string& b);

/// Shortest text that reads back as the same double, switching to
/// exponent form ("1.23456789e+06") below 1e-4 and from 1e6 upward.
/// NaN and infinities render as "NaN", "+Inf" and "-Inf".
std::string formatFloat(double value);
std::string formatFloat(float value);

/// Render a value as text: strings verbatim, bools as true/false,
/// floating-point values at full precision, 8-bit integers as numbers,
/// everything else through operator<<.
template <typename T>
std::string toText(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_convertible_v<const T&, std::string>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<T, float>) {
        return formatFloat(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return formatFloat(static_cast<double>(value));
    } else if constexpr (std::is_same_v<T, signed char> ||
                         std::is_same_v<T, unsigned char>) {
        return std::to_string(static_cast<int>(value));
    } else {
        std::ostringstream os;
        os << value;
        return os.str();
    }
}

} // namespace restcall

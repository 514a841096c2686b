#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace restcall {

namespace {

bool isControl(char c) {
    auto uc = static_cast<unsigned char>(c);
    return uc < 0x20 || uc == 0x7f;
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

void checkEscapes(const std::string& component, const std::string& url) {
    for (std::size_t i = 0; i < component.size(); ++i) {
        if (component[i] != '%') continue;
        if (i + 2 >= component.size() ||
            !isHex(component[i + 1]) || !isHex(component[i + 2])) {
            throw std::invalid_argument("Invalid URL escape in: " + url);
        }
        i += 2;
    }
}

void checkScheme(const std::string& scheme, const std::string& url) {
    if (scheme.empty()) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        throw std::invalid_argument("Invalid URL (bad scheme): " + url);
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '+' && c != '-' && c != '.') {
            throw std::invalid_argument("Invalid URL (bad scheme): " + url);
        }
    }
}

std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

template <typename F>
std::string shortestText(F value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    char buf[64];
    auto sci = std::to_chars(buf, buf + sizeof buf, value,
                             std::chars_format::scientific);
    std::string text(buf, sci.ptr);

    int exponent = std::stoi(text.substr(text.find('e') + 1));
    if (exponent < -4 || exponent >= 6) {
        return text;
    }
    auto fixed = std::to_chars(buf, buf + sizeof buf, value,
                               std::chars_format::fixed);
    return std::string(buf, fixed.ptr);
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    if (url.empty()) {
        throw std::invalid_argument("Invalid URL (empty)");
    }
    if (std::any_of(url.begin(), url.end(), isControl)) {
        throw std::invalid_argument(
            "Invalid URL (control character): " + url);
    }

    // --- fragment / query ---
    std::string rest = url;
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    auto question = rest.find('?');
    if (question != std::string::npos) {
        parts.query = rest.substr(question + 1);
        rest.erase(question);
    }

    // --- scheme ---
    auto schemeEnd = rest.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = rest.substr(0, schemeEnd);
    checkScheme(parts.scheme, url);
    std::transform(parts.scheme.begin(), parts.scheme.end(),
                   parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // --- authority (userinfo@host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = rest.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = rest.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = rest.substr(hostStart, pathStart - hostStart);
        parts.target = rest.substr(pathStart);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parts.userinfo = authority.substr(0, at);
        authority.erase(0, at + 1);
    }
    parts.authority = authority;

    // --- host / port ---
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument(
                "Invalid URL (unterminated IPv6 literal): " + url);
        }
        parts.host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                throw std::invalid_argument("Invalid URL (bad host): " + url);
            }
            port = after.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        parts.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port = authority.substr(colon + 1);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.host.find(' ') != std::string::npos) {
        throw std::invalid_argument("Invalid URL (space in host): " + url);
    }

    if (port.empty()) {
        parts.port = defaultPort(parts.scheme);
    } else {
        bool numeric = port.size() <= 5 &&
            std::all_of(port.begin(), port.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            });
        if (!numeric || std::stoi(port) > 65535) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
        parts.port = port;
    }

    checkEscapes(parts.userinfo, url);
    checkEscapes(parts.target, url);
    return parts;
}

std::string formatFloat(double value) {
    return shortestText(value);
}

std::string formatFloat(float value) {
    return shortestText(value);
}

std::string formatUrl(const UrlParts& parts) {
    std::string out = parts.scheme + "://" + parts.authority + parts.target;
    if (!parts.query.empty()) {
        out += '?';
        out += parts.query;
    }
    return out;
}

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

std::string queryEscape(const std::string& text) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0f];
        }
    }
    return out;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::string encodeValues(const Values& values) {
    std::string out;
    for (const auto& [name, list] : values) {
        auto key = queryEscape(name);
        for (const auto& value : list) {
            if (!out.empty()) out += '&';
            out += key;
            out += '=';
            out += queryEscape(value);
        }
    }
    return out;
}

} // namespace restcall

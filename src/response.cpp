#include "response.hpp"

namespace restcall {

std::string Response::header(const std::string& name) const {
    for (const auto& [key, values] : headers) {
        if (equalsIgnoreCase(key, name) && !values.empty()) {
            return values.front();
        }
    }
    return {};
}

} // namespace restcall

#include "retry_rules.hpp"

#include <utility>

namespace restcall {

bool isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

RetryPredicate retryOnError() {
    return [](RequestBuilder&,
              const std::optional<Response>&,
              const std::optional<RequestError>& error) {
        return error.has_value();
    };
}

RetryPredicate retryOnStatus(std::set<unsigned int> statuses) {
    return [statuses = std::move(statuses)](RequestBuilder&,
                                            const std::optional<Response>& response,
                                            const std::optional<RequestError>&) {
        return response && statuses.count(response->statusCode) > 0;
    };
}

RetryPredicate retryOnTransientFailure() {
    return [](RequestBuilder&,
              const std::optional<Response>& response,
              const std::optional<RequestError>& error) {
        if (error) {
            return true;
        }
        return response && isRetryableStatus(response->statusCode);
    };
}

} // namespace restcall

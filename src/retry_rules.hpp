#pragma once

#include "request_builder.hpp"

#include <set>

namespace restcall {

/// 429 Too Many Requests or any 5xx.
bool isRetryableStatus(unsigned int status);

/// Retry while the attempt failed with an error of any kind.
RetryPredicate retryOnError();

/// Retry while the response status is one of @p statuses.
RetryPredicate retryOnStatus(std::set<unsigned int> statuses);

/// Retry on any error, on 429 and on 5xx responses.
RetryPredicate retryOnTransientFailure();

} // namespace restcall

#include "retry_executor.hpp"
#include "request_builder.hpp"
#include "util.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace restcall {

namespace {

constexpr const char* kFormContentType = "application/x-www-form-urlencoded";

bool hasValues(const Values& values) {
    return std::any_of(values.begin(), values.end(), [](const auto& entry) {
        return !entry.second.empty();
    });
}

bool hasHeader(const TransportRequest& request, const std::string& name) {
    return std::any_of(request.headers.begin(), request.headers.end(),
                       [&name](const auto& header) {
                           return equalsIgnoreCase(header.first, name);
                       });
}

// "user:password" from the URL, decoded and base64-encoded.
std::string basicCredentials(const std::string& userinfo) {
    auto colon = userinfo.find(':');
    std::string plain = percentDecode(userinfo.substr(0, colon));
    plain += ':';
    if (colon != std::string::npos) {
        plain += percentDecode(userinfo.substr(colon + 1));
    }

    namespace base64 = boost::beast::detail::base64;
    std::string encoded(base64::encoded_size(plain.size()), '\0');
    encoded.resize(base64::encode(&encoded[0], plain.data(), plain.size()));
    return encoded;
}

void describe(std::ostream& os, const Outcome& outcome) {
    if (outcome.response) {
        os << "HTTP " << outcome.response->statusCode;
    } else if (outcome.error) {
        os << outcome.error->what();
    }
}

} // namespace

RetryExecutor::RetryExecutor(std::shared_ptr<Transport> transport)
    : mTransport(std::move(transport)) {}

// ---------------------------------------------------------------------------
// Assembly
// ---------------------------------------------------------------------------

TransportRequest RetryExecutor::assemble(const RequestBuilder& builder) {
    TransportRequest request;
    request.url         = parseUrl(builder.url());
    request.url.query   = encodeValues(builder.query());
    request.absoluteUrl = formatUrl(request.url);
    request.method      = builder.method();
    request.timeout     = builder.timeout();
    request.body        = builder.body();

    for (const auto& [name, values] : builder.headers()) {
        for (const auto& value : values) {
            request.headers.emplace_back(name, value);
        }
    }

    // URL credentials never override an explicit Authorization header.
    if (!request.url.userinfo.empty() && !hasHeader(request, "Authorization")) {
        request.headers.emplace_back(
            "Authorization", "Basic " + basicCredentials(request.url.userinfo));
    }

    // A raw body always wins over form fields.
    if (request.body.empty() && hasValues(builder.form())) {
        request.body = encodeValues(builder.form());
        if (!hasHeader(request, "Content-Type")) {
            request.headers.emplace_back("Content-Type", kFormContentType);
        }
    }
    return request;
}

// ---------------------------------------------------------------------------
// Single attempt
// ---------------------------------------------------------------------------

Outcome RetryExecutor::attempt(const TransportRequest& request) {
    Outcome outcome;
    ++mStats.totalAttempts;

    TransportResponse received;
    try {
        received = mTransport->roundTrip(request);
    } catch (const std::exception& e) {
        outcome.error.emplace(ErrorKind::Transport, e.what());
        return outcome;
    }

    Response response;
    response.statusCode = received.statusCode;
    response.headers    = std::move(received.headers);

    if (received.body) {
        try {
            while (received.body->readSome(response.body)) {
            }
        } catch (const std::exception& e) {
            outcome.error.emplace(ErrorKind::Read, e.what());
            return outcome;
        }
    }

    outcome.response = std::move(response);
    return outcome;
}

// ---------------------------------------------------------------------------
// Retry loop
// ---------------------------------------------------------------------------

Outcome RetryExecutor::execute(RequestBuilder& builder) {
    int remaining = std::max(builder.retryAttempts(), 0);
    if (remaining > 0 && !builder.retryPredicate()) {
        throw std::logic_error(
            "RequestBuilder: retry attempts configured without a retry predicate");
    }

    const int total = remaining + 1;

    for (;;) {
        TransportRequest request;
        try {
            request = assemble(builder);
        } catch (const std::invalid_argument& e) {
            Outcome outcome;
            outcome.error.emplace(ErrorKind::UrlParse, e.what());
            return outcome;
        }

        if (builder.verbose()) {
            std::cerr << "[RequestBuilder] " << request.method << " "
                      << request.absoluteUrl << " (attempt "
                      << (total - remaining) << "/" << total << ")\n";
        }

        Outcome outcome = attempt(request);

        if (remaining == 0) {
            return outcome;
        }

        // Copied: the predicate may reconfigure the builder it is given.
        RetryPredicate shouldRetry = builder.retryPredicate();
        if (!shouldRetry) {
            throw std::logic_error(
                "RequestBuilder: retry predicate removed while attempts remain");
        }
        if (!shouldRetry(builder, outcome.response, outcome.error)) {
            return outcome;
        }

        --remaining;
        ++mStats.totalRetries;

        const auto delay = builder.retryDelay();
        if (builder.verbose()) {
            std::cerr << "[Retry] ";
            describe(std::cerr, outcome);
            std::cerr << ", sleeping " << delay.count() << " ms ("
                      << remaining << " left)\n";
        }

        mStats.totalSleep += delay;
        std::this_thread::sleep_for(delay);
    }
}

} // namespace restcall

#pragma once

#include "response.hpp"
#include "transport.hpp"

#include <chrono>
#include <memory>

namespace restcall {

class RequestBuilder;

/// Runs a RequestBuilder: assembles the wire request, delegates to the
/// Transport, classifies the outcome and retries while the builder's
/// predicate approves and attempts remain.
class RetryExecutor {
public:
    struct Stats {
        int                       totalAttempts = 0;
        int                       totalRetries  = 0;
        std::chrono::milliseconds totalSleep{0};
    };

    explicit RetryExecutor(std::shared_ptr<Transport> transport);

    /// At most builder.retryAttempts() + 1 transport calls.  A URL parse
    /// failure returns at once without calling the transport.
    /// @throws std::logic_error if retries are configured without predicate.
    Outcome execute(RequestBuilder& builder);

    /// Build the transport request from the builder's current state.
    /// @throws std::invalid_argument if the URL cannot be parsed.
    static TransportRequest assemble(const RequestBuilder& builder);

    Stats getStats() const { return mStats; }

private:
    std::shared_ptr<Transport> mTransport;
    Stats                      mStats{};

    /// One round trip plus body drain, classified into response or error.
    Outcome attempt(const TransportRequest& request);
};

} // namespace restcall

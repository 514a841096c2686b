#pragma once

#include "transport.hpp"

#include <string>

namespace restcall {

/// Default Transport built on Boost.Beast.
/// Every round trip gets its own io_context and connection; nothing is
/// pooled across attempts.  The request timeout is a single deadline
/// covering resolve, connect, TLS handshake, write, header and body reads.
class BeastTransport : public Transport {
public:
    struct Options {
        std::string userAgent  = "restcall/1.0";
        bool        verifyPeer = true;   // https only
        bool        verbose    = false;
    };

    BeastTransport();
    explicit BeastTransport(Options options);

    /// @throws std::runtime_error on unsupported scheme, network or
    ///         timeout errors.
    TransportResponse roundTrip(const TransportRequest& request) override;

    const Options& options() const { return mOptions; }

private:
    Options mOptions;

    template <class Stream>
    TransportResponse start(const TransportRequest& request);
};

} // namespace restcall

#include "beast_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef RESTCALL_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace restcall {

namespace {

using Clock    = std::chrono::steady_clock;
using Deadline = std::optional<Clock::time_point>;

constexpr std::size_t kReadChunkSize = 16 * 1024;

/// I/O state of one attempt; outlives the stream built on top of it.
struct IoResources {
    net::io_context ioc;
#ifdef RESTCALL_HAS_SSL
    std::optional<net::ssl::context> tls;
#endif
};

std::string toStdString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

void check(const beast::error_code& ec, const std::string& what) {
    if (ec) {
        throw std::runtime_error(what + ": " + ec.message());
    }
}

/// Start one asynchronous operation and block until its handler has run.
/// Timeouts come from the tcp_stream expiry, which only covers async ops.
template <typename Initiate>
beast::error_code runToCompletion(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

tcp::resolver::results_type resolve(net::io_context& ioc,
                                    const UrlParts& url,
                                    const Deadline& deadline)
{
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    beast::error_code result = net::error::would_block;

    resolver.async_resolve(
        url.host, url.port,
        [&](beast::error_code ec, tcp::resolver::results_type found) {
            result  = ec;
            results = std::move(found);
        });

    ioc.restart();
    if (deadline) {
        ioc.run_until(*deadline);
    } else {
        ioc.run();
    }

    if (result == net::error::would_block) {
        // The resolver runs getaddrinfo() on a private thread that cancel()
        // cannot interrupt, so this run() still waits for the lookup to
        // return. A stalled DNS server can hold the attempt past its deadline.
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw std::runtime_error("resolve " + url.host + ": timeout exceeded");
    }
    check(result, "resolve " + url.host);
    return results;
}

// ---------------------------------------------------------------------------
// Per-stream-type hooks
// ---------------------------------------------------------------------------

template <class Stream>
struct StreamTraits;

template <>
struct StreamTraits<beast::tcp_stream> {
    static constexpr const char* kName = "HTTP";

    static beast::tcp_stream make(IoResources& io,
                                  const BeastTransport::Options&) {
        return beast::tcp_stream(io.ioc);
    }

    static beast::tcp_stream& lowest(beast::tcp_stream& stream) {
        return stream;
    }

    static beast::error_code handshake(IoResources&, beast::tcp_stream&,
                                       const UrlParts&,
                                       const BeastTransport::Options&) {
        return {};
    }
};

#ifdef RESTCALL_HAS_SSL
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

template <>
struct StreamTraits<TlsStream> {
    static constexpr const char* kName = "HTTPS";

    static TlsStream make(IoResources& io,
                          const BeastTransport::Options& options) {
        io.tls.emplace(net::ssl::context::tlsv12_client);
        io.tls->set_default_verify_paths();
        io.tls->set_verify_mode(options.verifyPeer ? net::ssl::verify_peer
                                                   : net::ssl::verify_none);
        return TlsStream(io.ioc, *io.tls);
    }

    static beast::tcp_stream& lowest(TlsStream& stream) {
        return beast::get_lowest_layer(stream);
    }

    static beast::error_code handshake(IoResources& io, TlsStream& stream,
                                       const UrlParts& url,
                                       const BeastTransport::Options& options) {
        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return beast::error_code(static_cast<int>(::ERR_get_error()),
                                     net::error::get_ssl_category());
        }
        if (options.verifyPeer) {
            stream.set_verify_callback(
                net::ssl::host_name_verification(url.host));
        }
        return runToCompletion(io.ioc, [&stream](auto handler) {
            stream.async_handshake(net::ssl::stream_base::client,
                                   std::move(handler));
        });
    }
};
#endif

// ---------------------------------------------------------------------------
// Exchange: one connection, one request, one streamed response
// ---------------------------------------------------------------------------

template <class Stream>
class Exchange final : public BodyReader {
public:
    explicit Exchange(BeastTransport::Options options)
        : mOptions(std::move(options))
        , mStream(StreamTraits<Stream>::make(mIo, mOptions))
    {
        mParser.body_limit(std::numeric_limits<std::uint64_t>::max());
    }

    ~Exchange() override {
        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code ec;
        StreamTraits<Stream>::lowest(mStream).socket().shutdown(
            tcp::socket::shutdown_both, ec);
    }

    /// Connect, send the request and read the response header.
    void open(const TransportRequest& request) {
        const auto& url = request.url;

        Deadline deadline;
        if (request.timeout.count() > 0) {
            deadline = Clock::now() + request.timeout;
        }

        if (mOptions.verbose) {
            std::cerr << "[BeastTransport] " << request.method << " "
                      << request.absoluteUrl << "\n";
        }

        // Resolve + connect, all under the attempt deadline.
        auto const results = resolve(mIo.ioc, url, deadline);
        auto& lowest = StreamTraits<Stream>::lowest(mStream);
        if (deadline) {
            lowest.expires_at(*deadline);
        } else {
            lowest.expires_never();
        }
        check(runToCompletion(mIo.ioc, [&](auto handler) {
                  lowest.async_connect(results, std::move(handler));
              }),
              "connect " + url.authority);

        check(StreamTraits<Stream>::handshake(mIo, mStream, url, mOptions),
              "TLS handshake with " + url.host);

        // Build request.
        http::request<http::string_body> req;
        req.version(11);
        const auto verb = http::string_to_verb(request.method);
        if (verb == http::verb::unknown) {
            req.method_string(request.method);
        } else {
            req.method(verb);
        }
        req.target(url.query.empty() ? url.target
                                     : url.target + "?" + url.query);
        for (const auto& [name, value] : request.headers) {
            req.insert(name, value);
        }
        if (req.find(http::field::host) == req.end()) {
            req.set(http::field::host, url.authority);
        }
        if (req.find(http::field::user_agent) == req.end()) {
            req.set(http::field::user_agent, mOptions.userAgent);
        }
        req.body() = request.body;
        req.prepare_payload();

        // Send.
        check(runToCompletion(mIo.ioc, [&](auto handler) {
                  http::async_write(mStream, req, std::move(handler));
              }),
              "write request");

        // Receive header; the body is pulled by readSome().
        if (verb == http::verb::head) {
            mParser.skip(true);
        }
        check(runToCompletion(mIo.ioc, [&](auto handler) {
                  http::async_read_header(mStream, mBuffer, mParser,
                                          std::move(handler));
              }),
              "read response header");

        if (mOptions.verbose) {
            std::cerr << "[BeastTransport] " << StreamTraits<Stream>::kName
                      << " " << statusCode() << "\n";
        }
    }

    unsigned int statusCode() const {
        return mParser.get().result_int();
    }

    Values headers() const {
        Values out;
        for (const auto& field : mParser.get()) {
            out[toStdString(field.name_string())].push_back(
                toStdString(field.value()));
        }
        return out;
    }

    bool readSome(std::string& out) override {
        if (mParser.is_done()) {
            return false;
        }

        std::array<char, kReadChunkSize> chunk;
        auto& body = mParser.get().body();
        body.data = chunk.data();
        body.size = chunk.size();

        auto ec = runToCompletion(mIo.ioc, [this](auto handler) {
            http::async_read(mStream, mBuffer, mParser, std::move(handler));
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        check(ec, "read response body");

        out.append(chunk.data(), chunk.size() - body.size);
        return true;
    }

private:
    BeastTransport::Options                  mOptions;
    IoResources                              mIo;
    Stream                                   mStream;
    beast::flat_buffer                       mBuffer;
    http::response_parser<http::buffer_body> mParser;
};

} // namespace

// ---------------------------------------------------------------------------
// BeastTransport
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport() = default;

BeastTransport::BeastTransport(Options options)
    : mOptions(std::move(options)) {}

template <class Stream>
TransportResponse BeastTransport::start(const TransportRequest& request) {
    auto exchange = std::make_unique<Exchange<Stream>>(mOptions);
    exchange->open(request);

    TransportResponse response;
    response.statusCode = exchange->statusCode();
    response.headers    = exchange->headers();
    response.body       = std::move(exchange);
    return response;
}

TransportResponse BeastTransport::roundTrip(const TransportRequest& request) {
    const auto& scheme = request.url.scheme;

    if (scheme == "http") {
        return start<beast::tcp_stream>(request);
    }
    if (scheme == "https") {
#ifdef RESTCALL_HAS_SSL
        return start<TlsStream>(request);
#else
        throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
    }
    throw std::runtime_error("unsupported protocol scheme \"" + scheme + "\"");
}

} // namespace restcall

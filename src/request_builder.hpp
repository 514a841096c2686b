#pragma once

#include "response.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <any>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace restcall {

class RequestBuilder;

/// Decides after an attempt whether another one should be made.
/// Receives the outcome of the current attempt only: exactly one of
/// @p response / @p error is engaged.
using RetryPredicate = std::function<bool(RequestBuilder& request,
                                          const std::optional<Response>& response,
                                          const std::optional<RequestError>& error)>;

/// Fluent accumulator for one outbound HTTP request with optional retry.
///
///     auto outcome = RequestBuilder::create("GET", "https://example.test/items")
///                        .addQuery("id", 42)
///                        .setTimeout(std::chrono::milliseconds(500))
///                        .send();
///
/// Setters mutate the builder in place and return it.  An instance is owned
/// by a single caller and is not safe for concurrent use.
class RequestBuilder {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{2000};

    /// @param transport  Engine performing the round trips; a BeastTransport
    ///                   is created when null.
    RequestBuilder(std::string method,
                   std::string url,
                   std::shared_ptr<Transport> transport = nullptr);

    static RequestBuilder create(const std::string& method,
                                 const std::string& url);

    // ---- configuration ----
    RequestBuilder& setTimeout(std::chrono::milliseconds timeout);

    /// Replace the whole retry policy.  @p attempts counts tries beyond the
    /// first and must not be negative; a predicate is required when it is
    /// positive.
    RequestBuilder& setRetry(int attempts,
                             std::chrono::milliseconds delay,
                             RetryPredicate predicate);

    /// Params are stored for the caller but never transmitted.
    RequestBuilder& setParam(std::map<std::string, std::string> params);

    template <typename T>
    RequestBuilder& addParam(const std::string& name, const T& value) {
        mParams[name] = toText(value);
        return *this;
    }

    RequestBuilder& setQuery(Values query);

    template <typename... Ts>
    RequestBuilder& addQuery(const std::string& name, const Ts&... values) {
        append(mQuery[name], values...);
        return *this;
    }

    RequestBuilder& setHeader(Values headers);

    template <typename... Ts>
    RequestBuilder& addHeader(const std::string& name, const Ts&... values) {
        append(mHeaders[name], values...);
        return *this;
    }

    /// Form fields become an application/x-www-form-urlencoded body when no
    /// raw body is set.
    RequestBuilder& setForm(Values form);

    template <typename... Ts>
    RequestBuilder& addForm(const std::string& name, const Ts&... values) {
        append(mForm[name], values...);
        return *this;
    }

    RequestBuilder& setBody(std::string body);

    /// Serialize @p json as the body; adds Content-Type: application/json
    /// unless one was already set.
    RequestBuilder& setJsonBody(const nlohmann::json& json);

    /// Opaque caller annotation, never interpreted here.
    RequestBuilder& setRecords(std::any records);

    RequestBuilder& setTransport(std::shared_ptr<Transport> transport);

    RequestBuilder& setVerbose(bool verbose);

    // ---- execution ----

    /// Perform up to retryAttempts() + 1 attempts and return the outcome of
    /// the last one.
    /// @throws std::logic_error if retries are configured without predicate.
    Outcome send();

    /// Like send(), but returns the response or throws its RequestError.
    Response sendOrThrow();

    // ---- accessors ----
    const std::string&                        method()         const { return mMethod; }
    const std::string&                        url()            const { return mUrl; }
    std::chrono::milliseconds                 timeout()        const { return mTimeout; }
    int                                       retryAttempts()  const { return mRetryAttempts; }
    std::chrono::milliseconds                 retryDelay()     const { return mRetryDelay; }
    const RetryPredicate&                     retryPredicate() const { return mRetryPredicate; }
    const std::map<std::string, std::string>& params()         const { return mParams; }
    const Values&                             query()          const { return mQuery; }
    const Values&                             headers()        const { return mHeaders; }
    const Values&                             form()           const { return mForm; }
    const std::string&                        body()           const { return mBody; }
    const std::any&                           records()        const { return mRecords; }
    bool                                      verbose()        const { return mVerbose; }

private:
    std::string                        mMethod;
    std::string                        mUrl;
    std::chrono::milliseconds          mTimeout = kDefaultTimeout;
    int                                mRetryAttempts = 0;
    std::chrono::milliseconds          mRetryDelay{0};
    RetryPredicate                     mRetryPredicate;
    std::map<std::string, std::string> mParams;
    Values                             mQuery;
    Values                             mHeaders;
    Values                             mForm;
    std::string                        mBody;
    std::any                           mRecords;
    std::shared_ptr<Transport>         mTransport;
    bool                               mVerbose = false;

    template <typename... Ts>
    static void append(std::vector<std::string>& out, const Ts&... values) {
        (out.push_back(toText(values)), ...);
    }
};

} // namespace restcall

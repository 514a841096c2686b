#include "request_builder.hpp"
#include "beast_transport.hpp"
#include "retry_executor.hpp"

#include <utility>

namespace restcall {

RequestBuilder::RequestBuilder(std::string method,
                               std::string url,
                               std::shared_ptr<Transport> transport)
    : mMethod(std::move(method))
    , mUrl(std::move(url))
    , mTransport(std::move(transport))
{
    if (!mTransport) {
        mTransport = std::make_shared<BeastTransport>();
    }
}

RequestBuilder RequestBuilder::create(const std::string& method,
                                      const std::string& url) {
    return RequestBuilder(method, url);
}

RequestBuilder& RequestBuilder::setTimeout(std::chrono::milliseconds timeout) {
    mTimeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::setRetry(int attempts,
                                         std::chrono::milliseconds delay,
                                         RetryPredicate predicate) {
    mRetryAttempts  = attempts;
    mRetryDelay     = delay;
    mRetryPredicate = std::move(predicate);
    return *this;
}

RequestBuilder& RequestBuilder::setParam(std::map<std::string, std::string> params) {
    mParams = std::move(params);
    return *this;
}

RequestBuilder& RequestBuilder::setQuery(Values query) {
    mQuery = std::move(query);
    return *this;
}

RequestBuilder& RequestBuilder::setHeader(Values headers) {
    mHeaders = std::move(headers);
    return *this;
}

RequestBuilder& RequestBuilder::setForm(Values form) {
    mForm = std::move(form);
    return *this;
}

RequestBuilder& RequestBuilder::setBody(std::string body) {
    mBody = std::move(body);
    return *this;
}

RequestBuilder& RequestBuilder::setJsonBody(const nlohmann::json& json) {
    mBody = json.dump();

    for (const auto& [name, values] : mHeaders) {
        if (equalsIgnoreCase(name, "Content-Type") && !values.empty()) {
            return *this;
        }
    }
    mHeaders["Content-Type"].push_back("application/json");
    return *this;
}

RequestBuilder& RequestBuilder::setRecords(std::any records) {
    mRecords = std::move(records);
    return *this;
}

RequestBuilder& RequestBuilder::setTransport(std::shared_ptr<Transport> transport) {
    mTransport = std::move(transport);
    if (!mTransport) {
        mTransport = std::make_shared<BeastTransport>();
    }
    return *this;
}

RequestBuilder& RequestBuilder::setVerbose(bool verbose) {
    mVerbose = verbose;
    return *this;
}

Outcome RequestBuilder::send() {
    RetryExecutor executor(mTransport);
    return executor.execute(*this);
}

Response RequestBuilder::sendOrThrow() {
    auto outcome = send();
    if (outcome.error) {
        throw *outcome.error;
    }
    return std::move(*outcome.response);
}

} // namespace restcall

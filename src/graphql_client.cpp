#include "graphql_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef APP_POLLER_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace app_poller {

namespace {

constexpr std::size_t kLoggedBodyLimit = 300;

http::request<http::string_body>
buildRequest(const std::string& host, const std::string& target,
             const std::string& tokenHeader, const std::string& token,
             const std::string& body)
{
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "app_poller/1.0");
    if (!token.empty()) {
        req.set(tokenHeader, token);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

GraphQLClient::Response toResponse(const http::response<http::string_body>& res) {
    GraphQLClient::Response response;
    response.httpStatus = res.result_int();
    if (res.body().empty()) {
        response.body = nlohmann::json::object();
        return response;
    }
    try {
        response.body = nlohmann::json::parse(res.body());
    } catch (const nlohmann::json::parse_error& e) {
        // Error pages from proxies are rarely JSON; keep the status usable.
        if (response.httpStatus >= 400) {
            response.body = nlohmann::json::object();
            return response;
        }
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }
    return response;
}

} // namespace

GraphQLClient::GraphQLClient(const std::string& endpoint,
                             const std::string& accessToken,
                             Options options)
    : mAccessToken(accessToken)
    , mOptions(std::move(options))
{
    const auto parts = parseUrl(endpoint);
    mHost   = parts.host;
    mPort   = parts.port;
    mTarget = parts.target;
    mUseSsl = (parts.scheme == "https");

#ifndef APP_POLLER_HAS_SSL
    if (mUseSsl) {
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in");
    }
#endif
}

GraphQLClient::Response
GraphQLClient::execute(const std::string& query,
                       const nlohmann::json& variables)
{
    nlohmann::json payload;
    payload["query"] = query;
    if (!variables.empty()) {
        payload["variables"] = variables;
    }
    const std::string body = payload.dump();

    if (mOptions.verbose) {
        auto& log = *mOptions.log;
        log << "[GraphQLClient] POST " << mHost << ":" << mPort << mTarget << "\n";
        log << "[GraphQLClient] Body: " << body.substr(0, kLoggedBodyLimit)
            << (body.size() > kLoggedBodyLimit ? " ...(truncated)" : "") << "\n";
    }

    Response response = mUseSsl ? doHttpsRequest(body) : doHttpRequest(body);

    if (mOptions.verbose) {
        *mOptions.log << "[GraphQLClient] HTTP " << response.httpStatus << "\n";
    }
    return response;
}

GraphQLClient::Response
GraphQLClient::doHttpRequest(const std::string& requestBody)
{
    const auto timeout = std::chrono::milliseconds(mOptions.timeoutMs);

    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    try {
        const auto results = resolver.resolve(mHost, mPort);
        stream.expires_after(timeout);
        stream.connect(results);

        auto req = buildRequest(mHost, mTarget, mOptions.tokenHeader,
                                mAccessToken, requestBody);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        stream.expires_after(timeout);
        http::read(stream, buffer, res);

        // Shutdown errors do not affect a response already read.
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        return toResponse(res);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string("HTTP request failed: ") + e.what());
    }
}

GraphQLClient::Response
GraphQLClient::doHttpsRequest(const std::string& requestBody)
{
#ifdef APP_POLLER_HAS_SSL
    namespace ssl = net::ssl;
    const auto timeout = std::chrono::milliseconds(mOptions.timeoutMs);

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    try {
        const auto results = resolver.resolve(mHost, mPort);
        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        auto req = buildRequest(mHost, mTarget, mOptions.tokenHeader,
                                mAccessToken, requestBody);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::get_lowest_layer(stream).expires_after(timeout);
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.shutdown(ec);

        return toResponse(res);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string("HTTPS request failed: ") + e.what());
    }
#else
    (void)requestBody;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace app_poller

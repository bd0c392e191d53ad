#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "Types.hpp"

// HTTPS GET client for the MBTA v3 API. Holds only read-only state, so one
// instance is shared by every concurrent stop query.
class MbtaClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string apiKey;
    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(std::string const& target) const;
    boost::asio::awaitable<void> sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);

public:
    static constexpr std::chrono::seconds REQUEST_TIMEOUT{30};

    MbtaClient(boost::asio::io_context& ioc, std::string key);

    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> fetch(std::string target);

    // 429 throws RateLimitedError, any other non-2xx throws FetchError.
    boost::asio::awaitable<std::string> get(std::string path, QueryParams params);

    static std::string buildTarget(std::string const& path, QueryParams const& params);
    static std::string percentEncode(std::string const& text);
};

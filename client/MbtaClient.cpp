#include <cctype>
#include <iomanip>
#include <sstream>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "MbtaClient.hpp"

MbtaClient::MbtaClient(boost::asio::io_context& ioc, std::string key)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , apiKey(std::move(key))
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void MbtaClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), ConfigurationManager::MBTA_HOST.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(ConfigurationManager::MBTA_HOST));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> MbtaClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(ConfigurationManager::MBTA_HOST, ConfigurationManager::MBTA_PORT, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> MbtaClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(REQUEST_TIMEOUT);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

boost::beast::http::request<boost::beast::http::string_body> MbtaClient::buildGetRequest(std::string const& target) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, target, 11);
    request.set(boost::beast::http::field::host, ConfigurationManager::MBTA_HOST);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, ConfigurationManager::ACCEPT_TYPE);
    if (!apiKey.empty())
        request.set("x-api-key", apiKey);

    return request;
}


boost::asio::awaitable<void> MbtaClient::sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> MbtaClient::readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::http::response<boost::beast::http::string_body> response;
    boost::beast::flat_buffer buffer;
    co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}


boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> MbtaClient::fetch(std::string target)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

    configureTlsStream(stream);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);
    co_await connect(results, stream);
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(target);
    co_await sendRequest(stream, request);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await readResponse(stream);
    co_await shutdownStream(stream);
    co_return response;
}

boost::asio::awaitable<std::string> MbtaClient::get(std::string path, QueryParams params)
{
    auto response = co_await fetch(buildTarget(path, params));
    unsigned status = response.result_int();

    if (status == 429)
        throw RateLimitedError();

    if (status < 200 || status >= 300)
        throw FetchError("HTTP " + std::to_string(status) + " from " + path);

    co_return response.body();
}


boost::asio::awaitable<void> MbtaClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    // servers often drop the connection instead of completing the TLS close
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

std::string MbtaClient::percentEncode(std::string const& text)
{
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out << c;
        else
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

std::string MbtaClient::buildTarget(std::string const& path, QueryParams const& params)
{
    std::string target = path;
    char sep = '?';
    for (auto const& [key, value] : params)
    {
        target += sep;
        target += percentEncode(key);
        target += '=';
        target += percentEncode(value);
        sep = '&';
    }
    return target;
}

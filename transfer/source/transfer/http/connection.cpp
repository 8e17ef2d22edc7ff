#include <transfer/http/connection.hpp>
#include <log/log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>

namespace Transfer::Http
{
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    using tcp = boost::asio::ip::tcp;

    template <typename FunctionT>
    decltype(auto) Connection::withStream(FunctionT&& func)
    {
        if (secureStream_)
            return func(*secureStream_);
        return func(*plainStream_);
    }

    template <typename InitiationT>
    std::expected<void, BackendError> Connection::run(char const* what, InitiationT&& initiate)
    {
        boost::system::error_code result{};
        withStream([this](auto& stream) {
            beast::get_lowest_layer(stream).expires_after(timeout_);
        });
        initiate([&result](boost::system::error_code ec, auto&&...) {
            result = ec;
        });
        ioContext_.restart();
        ioContext_.run();

        if (result == beast::error::timeout)
            return std::unexpected(BackendError{
                .message = fmt::format("{} {}:{} timed out", what, url_.host, url_.port),
                .timedOut = true,
            });
        if (result)
            return std::unexpected(BackendError{
                .message = fmt::format("{} {}:{} failed: {}", what, url_.host, url_.port, result.message()),
            });
        return {};
    }

    Connection::Connection(ConstructionTag, Url url, std::chrono::milliseconds timeout)
        : url_{std::move(url)}
        , timeout_{timeout}
        , sslContext_{boost::asio::ssl::context::tlsv12_client}
    {
        if (url_.isSecure())
        {
            sslContext_.set_default_verify_paths();
            sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
            sslContext_.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
            secureStream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioContext_, sslContext_);
        }
        else
            plainStream_ = std::make_unique<beast::tcp_stream>(ioContext_);
    }

    Connection::~Connection()
    {
        boost::system::error_code ec;
        withStream([&ec](auto& stream) {
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(stream).socket().close(ec);
        });
    }

    std::expected<std::unique_ptr<Connection>, BackendError>
    Connection::open(Url const& url, std::chrono::milliseconds timeout)
    {
        auto connection = std::make_unique<Connection>(ConstructionTag{}, url, timeout);
        if (auto result = connection->connect(); !result)
            return std::unexpected(result.error());
        return connection;
    }

    void Connection::setTimeout(std::chrono::milliseconds timeout)
    {
        timeout_ = timeout;
    }

    std::expected<void, BackendError> Connection::connect()
    {
        tcp::resolver resolver{ioContext_};
        tcp::resolver::results_type endpoints{};
        boost::system::error_code resolveError{};
        resolver.async_resolve(
            url_.host, url_.port, [&endpoints, &resolveError](boost::system::error_code ec, auto results) {
                resolveError = ec;
                endpoints = std::move(results);
            });
        ioContext_.restart();
        ioContext_.run();
        if (resolveError)
            return std::unexpected(BackendError{
                .message = fmt::format("Cannot resolve {}: {}", url_.host, resolveError.message()),
            });

        auto connected = run("Connecting to", [this, &endpoints](auto handler) {
            withStream([&endpoints, &handler](auto& stream) {
                beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
            });
        });
        if (!connected)
            return connected;

        if (!secureStream_)
            return {};

        if (!SSL_set_tlsext_host_name(secureStream_->native_handle(), url_.host.c_str()))
            return std::unexpected(BackendError{.message = "Cannot set TLS server name " + url_.host});

        return run("TLS handshake with", [this](auto handler) {
            secureStream_->async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });
    }

    std::expected<Response, BackendError>
    Connection::send(http::request<http::string_body>& request)
    {
        request.prepare_payload();
        auto written = run("Writing request to", [this, &request](auto handler) {
            withStream([&request, &handler](auto& stream) {
                http::async_write(stream, request, std::move(handler));
            });
        });
        if (!written)
            return std::unexpected(written.error());
        return readResponse();
    }

    std::expected<void, BackendError> Connection::writeHeader(http::request<http::empty_body>& request)
    {
        http::request_serializer<http::empty_body> serializer{request};
        return run("Writing request header to", [this, &serializer](auto handler) {
            withStream([&serializer, &handler](auto& stream) {
                http::async_write_header(stream, serializer, std::move(handler));
            });
        });
    }

    std::expected<void, BackendError> Connection::writeBody(std::span<char const> data)
    {
        return run("Writing body to", [this, data](auto handler) {
            withStream([data, &handler](auto& stream) {
                boost::asio::async_write(stream, boost::asio::buffer(data.data(), data.size()), std::move(handler));
            });
        });
    }

    std::expected<Response, BackendError> Connection::readResponse()
    {
        http::response<http::string_body> response{};
        auto read = run("Reading response from", [this, &response](auto handler) {
            withStream([this, &response, &handler](auto& stream) {
                http::async_read(stream, readBuffer_, response, std::move(handler));
            });
        });
        if (!read)
            return std::unexpected(read.error());

        Log::trace("Connection: {} {} answered {}.", url_.host, url_.target, response.result_int());
        return Response{
            .status = response.result_int(),
            .body = std::move(response.body()),
        };
    }
}

#pragma once

#include <transfer/backend_api.hpp>
#include <transfer/http/url.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace Transfer::Http
{
    struct Response
    {
        unsigned int status{0};
        std::string body{};

        bool isSuccess() const
        {
            return status >= 200 && status < 300;
        }
    };

    /**
     * @brief One HTTP/1.1 connection, TLS for https urls. Every operation is bounded by the current timeout,
     * a timeout yields a BackendError with timedOut set.
     */
    class Connection
    {
      private:
        struct ConstructionTag
        {
            explicit ConstructionTag() = default;
        };

      public:
        static std::expected<std::unique_ptr<Connection>, BackendError>
        open(Url const& url, std::chrono::milliseconds timeout);

        /// Use open().
        Connection(ConstructionTag, Url url, std::chrono::milliseconds timeout);
        ~Connection();
        Connection(Connection const&) = delete;
        Connection& operator=(Connection const&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        void setTimeout(std::chrono::milliseconds timeout);

        /**
         * @brief Writes a complete request and reads the response.
         */
        std::expected<Response, BackendError>
        send(boost::beast::http::request<boost::beast::http::string_body>& request);

        /**
         * @brief Writes only the header of a request. The body follows through writeBody calls.
         */
        std::expected<void, BackendError>
        writeHeader(boost::beast::http::request<boost::beast::http::empty_body>& request);
        std::expected<void, BackendError> writeBody(std::span<char const> data);
        std::expected<Response, BackendError> readResponse();

        Url const& url() const
        {
            return url_;
        }

      private:
        std::expected<void, BackendError> connect();

        template <typename InitiationT>
        std::expected<void, BackendError> run(char const* what, InitiationT&& initiate);

        template <typename FunctionT>
        decltype(auto) withStream(FunctionT&& func);

      private:
        Url url_;
        std::chrono::milliseconds timeout_;
        boost::asio::io_context ioContext_{};
        boost::asio::ssl::context sslContext_;
        std::unique_ptr<boost::beast::tcp_stream> plainStream_{};
        std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> secureStream_{};
        boost::beast::flat_buffer readBuffer_{};
    };
}

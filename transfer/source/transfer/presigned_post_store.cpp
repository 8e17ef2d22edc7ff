#include <transfer/presigned_post_store.hpp>
#include <transfer/http/connection.hpp>
#include <log/log.hpp>
#include <ids/ids.hpp>

#include <boost/beast/version.hpp>

#include <array>

namespace Transfer
{
    namespace http = boost::beast::http;

    namespace
    {
        SharedData::TransferError fromBackendError(BackendError const& error)
        {
            return toTransferError(error, SharedData::TransferErrorType::Transfer);
        }

        std::string escapeQuotes(std::string value)
        {
            std::string escaped{};
            escaped.reserve(value.size());
            for (char c : value)
            {
                if (c == '"')
                    escaped += "%22";
                else if (c == '\r' || c == '\n')
                    escaped += ' ';
                else
                    escaped += c;
            }
            return escaped;
        }
    }

    PresignedPostStore::MultipartFrame
    PresignedPostStore::makeMultipartFrame(SharedData::DestinationDescriptor const& destination, IPayload const& payload)
    {
        MultipartFrame frame{.boundary = "----vaultline" + Ids::generateId().value()};
        for (auto const& [name, value] : destination.fields)
        {
            frame.head += "--" + frame.boundary + "\r\n";
            frame.head += "Content-Disposition: form-data; name=\"" + escapeQuotes(name) + "\"\r\n\r\n";
            frame.head += value + "\r\n";
        }
        frame.head += "--" + frame.boundary + "\r\n";
        frame.head += "Content-Disposition: form-data; name=\"file\"; filename=\"" + escapeQuotes(payload.name()) +
            "\"\r\n";
        frame.head += "Content-Type: " + payload.mimeType() + "\r\n\r\n";
        frame.tail = "\r\n--" + frame.boundary + "--\r\n";
        return frame;
    }

    std::expected<void, SharedData::TransferError> PresignedPostStore::put(
        SharedData::DestinationDescriptor const& destination,
        IPayload const& payload,
        TransferProgressCallback const& onProgress,
        CancellationSignal const& cancel,
        std::chrono::milliseconds timeout)
    {
        const auto cancelled = [&payload]() {
            return std::unexpected(SharedData::TransferError{
                .type = SharedData::TransferErrorType::Transfer,
                .message = "Transfer of " + payload.name() + " was cancelled",
            });
        };

        auto url = Http::Url::parse(destination.url);
        if (!url)
            return std::unexpected(
                SharedData::TransferError{.type = SharedData::TransferErrorType::Transfer, .message = url.error()});

        auto reader = payload.open();
        if (!reader)
            return std::unexpected(reader.error());

        auto connection = Http::Connection::open(*url, timeout);
        if (!connection)
            return std::unexpected(fromBackendError(connection.error()));

        const auto frame = makeMultipartFrame(destination, payload);
        const auto total = payload.size();

        http::request<http::empty_body> request{http::verb::post, url->target, 11};
        request.set(http::field::host, url->host);
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        request.set(http::field::content_type, "multipart/form-data; boundary=" + frame.boundary);
        for (auto const& [name, value] : destination.headers)
            request.set(name, value);
        request.content_length(frame.head.size() + total + frame.tail.size());

        if (auto result = (*connection)->writeHeader(request); !result)
            return std::unexpected(fromBackendError(result.error()));
        if (auto result = (*connection)->writeBody(frame.head); !result)
            return std::unexpected(fromBackendError(result.error()));

        std::array<char, chunkSize> buffer{};
        std::uint64_t sent = 0;
        while (sent < total)
        {
            if (cancel.isCancelled())
                return cancelled();

            const auto wanted = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), total - sent));
            (*reader)->read(buffer.data(), wanted);
            const auto got = (*reader)->gcount();
            if (got <= 0)
                return std::unexpected(SharedData::TransferError{
                    .type = SharedData::TransferErrorType::PayloadUnavailable,
                    .message = fmt::format("{} ended after {} of {} bytes", payload.name(), sent, total),
                });

            if (auto result = (*connection)->writeBody(std::span<char const>{buffer.data(), static_cast<std::size_t>(got)});
                !result)
            {
                return std::unexpected(fromBackendError(result.error()));
            }
            sent += static_cast<std::uint64_t>(got);
            if (onProgress)
                onProgress(sent, total);
        }

        if (cancel.isCancelled())
            return cancelled();

        if (auto result = (*connection)->writeBody(frame.tail); !result)
            return std::unexpected(fromBackendError(result.error()));

        auto response = (*connection)->readResponse();
        if (!response)
            return std::unexpected(fromBackendError(response.error()));

        if (!response->isSuccess())
        {
            Log::warn(
                "PresignedPostStore: {} rejected {} with {}: {}",
                url->host,
                payload.name(),
                response->status,
                response->body.substr(0, 256));
            return std::unexpected(fromBackendError(BackendError{
                .httpStatus = static_cast<int>(response->status),
                .message = fmt::format("Object store answered {}", response->status),
            }));
        }

        if (total == 0 && onProgress)
            onProgress(0, 0);
        return {};
    }
}

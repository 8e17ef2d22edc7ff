#include <transfer/http_backend_api.hpp>
#include <transfer/http/connection.hpp>
#include <log/log.hpp>

#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>

namespace Transfer
{
    namespace http = boost::beast::http;

    namespace
    {
        /// The backend keys files by integer primary keys.
        nlohmann::json fileIdToJson(Ids::FileId const& id)
        {
            auto const& value = id.value();
            if (!value.empty() && value.size() < 19 && std::all_of(value.begin(), value.end(), [](unsigned char c) {
                    return std::isdigit(c);
                }))
            {
                return std::stoll(value);
            }
            return value;
        }

        std::string errorMessage(Http::Response const& response)
        {
            const auto json = nlohmann::json::parse(response.body, nullptr, false);
            if (json.is_object())
            {
                for (auto const* key : {"error", "detail", "message"})
                {
                    if (json.contains(key) && json[key].is_string())
                        return json[key].get<std::string>();
                }
            }
            if (response.body.empty())
                return fmt::format("HTTP {}", response.status);
            return response.body.substr(0, 256);
        }
    }

    HttpBackendApi::HttpBackendApi(Options options)
        : options_{std::move(options)}
    {}

    std::expected<nlohmann::json, BackendError> HttpBackendApi::post(std::string const& path, nlohmann::json const& body)
    {
        const auto url = options_.baseUrl.withPath(path);
        auto connection = Http::Connection::open(url, options_.timeout);
        if (!connection)
            return std::unexpected(connection.error());

        http::request<http::string_body> request{http::verb::post, url.target, 11};
        request.set(http::field::host, url.host);
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        request.set(http::field::content_type, "application/json");
        request.set(http::field::accept, "application/json");
        if (options_.token)
            request.set(http::field::authorization, "Bearer " + *options_.token);
        request.body() = body.dump();

        auto response = (*connection)->send(request);
        if (!response)
            return std::unexpected(response.error());

        if (!response->isSuccess())
        {
            const auto error = BackendError{
                .httpStatus = static_cast<int>(response->status),
                .message = errorMessage(*response),
            };
            Log::warn("HttpBackendApi: POST {} failed: {}", url.target, error.toString());
            return std::unexpected(error);
        }

        if (response->body.empty())
            return nlohmann::json::object();

        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded())
            return std::unexpected(BackendError{
                .httpStatus = static_cast<int>(response->status),
                .message = "Response is not valid JSON",
            });
        return json;
    }

    nlohmann::json HttpBackendApi::encodeDestinationRequests(std::vector<SharedData::DestinationRequest> const& requests)
    {
        auto files = nlohmann::json::array();
        for (auto const& request : requests)
        {
            nlohmann::json file{
                {"filename", request.filename},
                {"fileType", request.fileType},
                {"fileSize", request.fileSize},
                {"relativePath", request.relativePath},
            };
            if (request.encryption)
                file["encryption_metadata"] = *request.encryption;
            files.push_back(std::move(file));
        }
        return nlohmann::json{{"files", std::move(files)}};
    }

    std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>
    HttpBackendApi::decodeDestinations(nlohmann::json const& response)
    {
        try
        {
            nlohmann::json const* results = nullptr;
            if (response.contains("results"))
                results = &response["results"];
            else if (response.contains("presigned_urls"))
                results = &response["presigned_urls"];
            if (!results || !results->is_array())
                return std::unexpected(
                    BackendError{.httpStatus = 200, .message = "Response carries no destination list"});

            std::vector<SharedData::NegotiatedDestination> destinations{};
            destinations.reserve(results->size());
            for (auto const& entry : *results)
            {
                auto const& presigned = entry.at("presignedUrl");
                SharedData::NegotiatedDestination destination{
                    .destination =
                        SharedData::DestinationDescriptor{
                            .url = presigned.at("url").get<std::string>(),
                        },
                    .fileId = entry.at("fileId").get<Ids::FileId>(),
                    .remoteKey = entry.value("s3Key", std::string{}),
                };
                if (presigned.contains("fields") && presigned["fields"].is_object())
                {
                    for (auto const& [key, value] : presigned["fields"].items())
                        destination.destination.fields[key] = value.is_string() ? value.get<std::string>() : value.dump();
                }
                if (presigned.contains("headers") && presigned["headers"].is_object())
                {
                    for (auto const& [key, value] : presigned["headers"].items())
                        destination.destination.headers[key] = value.get<std::string>();
                }
                destinations.push_back(std::move(destination));
            }
            return destinations;
        }
        catch (std::exception const& e)
        {
            return std::unexpected(
                BackendError{.httpStatus = 200, .message = fmt::format("Malformed destination list: {}", e.what())});
        }
    }

    nlohmann::json HttpBackendApi::encodeFileIds(std::vector<Ids::FileId> const& fileIds)
    {
        auto ids = nlohmann::json::array();
        for (auto const& id : fileIds)
            ids.push_back(fileIdToJson(id));
        return nlohmann::json{{"file_ids", std::move(ids)}};
    }

    std::expected<SharedData::BulkDeleteResult, BackendError>
    HttpBackendApi::decodeBulkDelete(nlohmann::json const& response)
    {
        try
        {
            SharedData::BulkDeleteResult result{};
            if (response.contains("summary"))
                result.successCount = response["summary"].value("successfully_deleted", std::uint64_t{0});

            if (response.contains("failed_files") && response["failed_files"].is_array())
            {
                for (auto const& failed : response["failed_files"])
                {
                    result.failedItems.push_back(SharedData::FailedDeletion{
                        .fileId = failed.at("file_id").get<Ids::FileId>(),
                        .filename = failed.value("filename", std::string{}),
                        .error = failed.value("error", std::string{}),
                    });
                }
            }
            return result;
        }
        catch (std::exception const& e)
        {
            return std::unexpected(
                BackendError{.httpStatus = 200, .message = fmt::format("Malformed delete summary: {}", e.what())});
        }
    }

    std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>
    HttpBackendApi::negotiateDestinations(std::vector<SharedData::DestinationRequest> const& requests)
    {
        auto response = post(options_.negotiatePath, encodeDestinationRequests(requests));
        if (!response)
            return std::unexpected(response.error());
        return decodeDestinations(*response);
    }

    std::expected<void, BackendError> HttpBackendApi::commitCompletion(std::vector<Ids::FileId> const& fileIds)
    {
        auto response = post(options_.commitPath, encodeFileIds(fileIds));
        if (!response)
            return std::unexpected(response.error());
        return {};
    }

    std::expected<SharedData::BulkDeleteResult, BackendError>
    HttpBackendApi::bulkDelete(std::vector<Ids::FileId> const& fileIds)
    {
        auto response = post(options_.deletePath, encodeFileIds(fileIds));
        if (!response)
            return std::unexpected(response.error());
        return decodeBulkDelete(*response);
    }
}

#pragma once

#include <transfer/backend_api.hpp>
#include <transfer/http/url.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace Transfer
{
    /**
     * @brief Backend contract over HTTP with JSON bodies and bearer token authentication.
     */
    class HttpBackendApi : public IBackendApi
    {
      public:
        struct Options
        {
            Http::Url baseUrl{};
            std::optional<std::string> token{std::nullopt};
            std::chrono::milliseconds timeout{std::chrono::seconds{300}};
            std::string negotiatePath{"/media-files/get_presigned_urls/"};
            std::string commitPath{"/uppy/upload-complete/"};
            std::string deletePath{"/media-files/bulk_delete/"};
        };

        explicit HttpBackendApi(Options options);

        std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>
        negotiateDestinations(std::vector<SharedData::DestinationRequest> const& requests) override;

        std::expected<void, BackendError> commitCompletion(std::vector<Ids::FileId> const& fileIds) override;

        std::expected<SharedData::BulkDeleteResult, BackendError>
        bulkDelete(std::vector<Ids::FileId> const& fileIds) override;

        static nlohmann::json encodeDestinationRequests(std::vector<SharedData::DestinationRequest> const& requests);
        static std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>
        decodeDestinations(nlohmann::json const& response);
        static nlohmann::json encodeFileIds(std::vector<Ids::FileId> const& fileIds);
        static std::expected<SharedData::BulkDeleteResult, BackendError>
        decodeBulkDelete(nlohmann::json const& response);

      private:
        std::expected<nlohmann::json, BackendError> post(std::string const& path, nlohmann::json const& body);

      private:
        Options options_;
    };
}

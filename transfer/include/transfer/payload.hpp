#pragma once

#include <shared_data/transfer/transfer_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Transfer
{
    /**
     * @brief Bytes that can be uploaded. open() may be called more than once, every reader starts at offset 0.
     */
    class IPayload
    {
      public:
        virtual ~IPayload() = default;

        virtual std::string name() const = 0;
        virtual std::uint64_t size() const = 0;
        virtual std::string mimeType() const = 0;
        /// Milliseconds since epoch.
        virtual std::int64_t lastModified() const = 0;

        virtual std::expected<std::unique_ptr<std::istream>, SharedData::TransferError> open() const = 0;
    };

    class FilePayload : public IPayload
    {
      public:
        explicit FilePayload(std::filesystem::path path, std::optional<std::string> mimeType = std::nullopt);

        std::string name() const override;
        std::uint64_t size() const override;
        std::string mimeType() const override;
        std::int64_t lastModified() const override;
        std::expected<std::unique_ptr<std::istream>, SharedData::TransferError> open() const override;

        std::filesystem::path const& path() const
        {
            return path_;
        }

      private:
        std::filesystem::path path_;
        std::string mimeType_;
        std::uint64_t size_;
        std::int64_t lastModified_;
    };

    class MemoryPayload : public IPayload
    {
      public:
        MemoryPayload(
            std::string name,
            std::vector<std::uint8_t> data,
            std::string mimeType = "application/octet-stream",
            std::int64_t lastModified = 0);

        std::string name() const override;
        std::uint64_t size() const override;
        std::string mimeType() const override;
        std::int64_t lastModified() const override;
        std::expected<std::unique_ptr<std::istream>, SharedData::TransferError> open() const override;

      private:
        std::string name_;
        std::vector<std::uint8_t> data_;
        std::string mimeType_;
        std::int64_t lastModified_;
    };

    std::string guessMimeType(std::filesystem::path const& path);

    /**
     * @brief Reads the whole payload into memory.
     */
    std::expected<std::vector<std::uint8_t>, SharedData::TransferError> readPayload(IPayload const& payload);
}

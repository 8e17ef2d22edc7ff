#include <transfer/payload.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <chrono>
#include <fstream>
#include <iterator>
#include <spanstream>
#include <unordered_map>

namespace Transfer
{
    namespace
    {
        SharedData::TransferError unavailable(std::string message)
        {
            return SharedData::TransferError{
                .type = SharedData::TransferErrorType::PayloadUnavailable,
                .message = std::move(message),
            };
        }
    }

    std::string guessMimeType(std::filesystem::path const& path)
    {
        static const std::unordered_map<std::string, std::string> mimeTypes{
            {".txt", "text/plain"},
            {".csv", "text/csv"},
            {".html", "text/html"},
            {".json", "application/json"},
            {".xml", "application/xml"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".gz", "application/gzip"},
            {".tar", "application/x-tar"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".mp4", "video/mp4"},
            {".mov", "video/quicktime"},
            {".mkv", "video/x-matroska"},
        };

        auto extension = path.extension().string();
        Utility::Algorithm::toLowerCaseInplace(extension);
        if (auto iter = mimeTypes.find(extension); iter != mimeTypes.end())
            return iter->second;
        return "application/octet-stream";
    }

    FilePayload::FilePayload(std::filesystem::path path, std::optional<std::string> mimeType)
        : path_{std::move(path)}
        , mimeType_{mimeType ? std::move(*mimeType) : guessMimeType(path_)}
        , size_{0}
        , lastModified_{0}
    {
        std::error_code ec;
        if (const auto size = std::filesystem::file_size(path_, ec); !ec)
            size_ = size;
        if (const auto lastWrite = std::filesystem::last_write_time(path_, ec); !ec)
        {
            lastModified_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::file_clock::to_sys(lastWrite).time_since_epoch())
                                .count();
        }
    }

    std::string FilePayload::name() const
    {
        return path_.filename().string();
    }
    std::uint64_t FilePayload::size() const
    {
        return size_;
    }
    std::string FilePayload::mimeType() const
    {
        return mimeType_;
    }
    std::int64_t FilePayload::lastModified() const
    {
        return lastModified_;
    }

    std::expected<std::unique_ptr<std::istream>, SharedData::TransferError> FilePayload::open() const
    {
        auto stream = std::make_unique<std::ifstream>(path_, std::ios_base::binary);
        if (!stream->good())
            return std::unexpected(unavailable("Cannot open " + path_.string()));
        return stream;
    }

    MemoryPayload::MemoryPayload(
        std::string name,
        std::vector<std::uint8_t> data,
        std::string mimeType,
        std::int64_t lastModified)
        : name_{std::move(name)}
        , data_{std::move(data)}
        , mimeType_{std::move(mimeType)}
        , lastModified_{lastModified}
    {}

    std::string MemoryPayload::name() const
    {
        return name_;
    }
    std::uint64_t MemoryPayload::size() const
    {
        return data_.size();
    }
    std::string MemoryPayload::mimeType() const
    {
        return mimeType_;
    }
    std::int64_t MemoryPayload::lastModified() const
    {
        return lastModified_;
    }

    std::expected<std::unique_ptr<std::istream>, SharedData::TransferError> MemoryPayload::open() const
    {
        return std::make_unique<std::ispanstream>(
            std::span<char const>{reinterpret_cast<char const*>(data_.data()), data_.size()});
    }

    std::expected<std::vector<std::uint8_t>, SharedData::TransferError> readPayload(IPayload const& payload)
    {
        auto stream = payload.open();
        if (!stream)
            return std::unexpected(stream.error());

        std::vector<std::uint8_t> bytes{};
        bytes.reserve(payload.size());
        bytes.assign(std::istreambuf_iterator<char>{**stream}, std::istreambuf_iterator<char>{});
        if ((*stream)->bad())
            return std::unexpected(unavailable("Reading " + payload.name() + " failed"));
        return bytes;
    }
}

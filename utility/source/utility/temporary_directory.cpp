#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace Utility
{
    namespace
    {
        [[maybe_unused]] std::string generateRandomString(int length)
        {
            std::string characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
            std::string randomString;

            std::mt19937 rng(std::random_device{}());
            std::uniform_int_distribution<int> distribution(0, static_cast<int>(characters.length()) - 1);

            for (int i = 0; i < length; ++i)
                randomString += characters[distribution(rng)];

            return randomString;
        }
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "vaultline_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBase)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBase_{removeBase}
    {
        if (!std::filesystem::exists(basePath_))
            std::filesystem::create_directories(basePath_);

#if __linux__
        std::string dirNameAsString{(basePath_ / "dirXXXXXX").string()};
        bool valid = mkdtemp(&dirNameAsString[0]) && std::filesystem::is_directory(dirNameAsString);
        if (valid)
            path_ = dirNameAsString;
#else
        int i = 0;
        for (; i != 1000; ++i)
        {
            const auto path = basePath_ / ("dir"s + generateRandomString(10));
            if (!std::filesystem::exists(path))
            {
                std::filesystem::create_directory(path);
                path_ = path;
                break;
            }
        }
        bool valid = i != 1000;
#endif
        if (!valid)
            throw std::runtime_error(std::string{"Could not setup temporary directory below: "} + basePath_.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        if (removeBase_ && std::filesystem::is_empty(basePath_, error))
            std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}

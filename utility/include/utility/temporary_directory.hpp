#pragma once

#include <filesystem>

namespace Utility
{
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();
        /**
         * @brief Creates a unique directory below basePath.
         *
         * @param basePath Parent of the unique directory, created when missing.
         * @param removeBase Also removes basePath on destruction if it is empty by then.
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBase);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBase_;
    };
}

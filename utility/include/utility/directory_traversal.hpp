#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace Utility
{
    /**
     * @brief Breadth first walk below a root directory. The scanner lists one directory and returns its entries
     * with paths relative to that directory. The root itself is the first entry.
     *
     * EntryT needs path, type, size and parent members, a FileType enum with Directory and
     * isRegularFile()/isDirectory().
     */
    template <typename EntryT, typename WalkErrorType, typename ScannerT>
    requires std::
        is_invocable_r_v<std::expected<std::vector<EntryT>, WalkErrorType>, ScannerT, std::filesystem::path const&>
        class DirectoryWalker
    {
      public:
        template <typename ForwardingScannerT = ScannerT>
        requires std::is_same_v<std::decay_t<ForwardingScannerT>, ScannerT>
        DirectoryWalker(std::filesystem::path rootPath, ForwardingScannerT&& scanner)
            : rootPath_{std::move(rootPath)}
            , scanner_{std::forward<ForwardingScannerT>(scanner)}
            , entries_{rootEntry()}
        {}

        std::vector<EntryT> ejectEntries() &&
        {
            return std::move(entries_);
        }

        std::vector<EntryT> const& entries() const
        {
            return entries_;
        }

        std::uint64_t totalBytes() const
        {
            return totalBytes_;
        }

        std::size_t fileCount() const
        {
            return fileCount_;
        }

        bool completed() const
        {
            return currentIndex_ >= entries_.size();
        }

        void reset()
        {
            entries_ = {rootEntry()};
            currentIndex_ = 0;
            totalBytes_ = 0;
            fileCount_ = 0;
        }

        /**
         * @brief Scans the next directory.
         *
         * @return true when nothing is left to scan.
         */
        std::expected<bool, WalkErrorType> walk()
        {
            // skip over files, only directories are scanned
            for (; currentIndex_ < entries_.size(); ++currentIndex_)
            {
                auto const& current = entries_[currentIndex_];
                if (current.isDirectory())
                    break;
                if (current.isRegularFile())
                {
                    totalBytes_ += current.size;
                    ++fileCount_;
                }
            }
            if (completed())
                return true;

            auto result = scanner_(fullPath(entries_[currentIndex_]));
            if (!result)
                return std::unexpected(std::move(result).error());

            const auto parent = currentIndex_;
            ++currentIndex_;
            for (auto& entry : result.value())
            {
                entry.parent = parent;
                entries_.push_back(std::move(entry));
            }
            return false;
        }

        std::expected<void, WalkErrorType> walkAll()
        {
            while (true)
            {
                auto result = walk();
                if (!result)
                    return std::unexpected(std::move(result).error());
                if (result.value())
                    return {};
            }
        }

        std::filesystem::path fullPath(EntryT const& entry) const
        {
            if (!entry.parent)
                return entry.path;

            const auto parentIndex = entry.parent.value();
            if (parentIndex >= entries_.size())
                throw std::out_of_range("Parent index is out of range");
            return fullPath(entries_[parentIndex]) / entry.path;
        }

        /**
         * @brief Path of the entry below the root, starting with the name of the root directory.
         */
        std::filesystem::path relativePath(EntryT const& entry) const
        {
            if (!entry.parent)
                return rootPath_.filename().empty() ? rootPath_.parent_path().filename() : rootPath_.filename();

            const auto parentIndex = entry.parent.value();
            if (parentIndex >= entries_.size())
                throw std::out_of_range("Parent index is out of range");
            return relativePath(entries_[parentIndex]) / entry.path;
        }

      private:
        EntryT rootEntry() const
        {
            return EntryT{
                .path = rootPath_,
                .type = EntryT::FileType::Directory,
            };
        }

      private:
        std::filesystem::path rootPath_;
        ScannerT scanner_;
        std::vector<EntryT> entries_{};
        std::size_t currentIndex_{0};
        std::uint64_t totalBytes_{0};
        std::size_t fileCount_{0};
    };
}

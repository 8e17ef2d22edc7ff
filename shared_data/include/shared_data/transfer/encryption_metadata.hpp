#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief Identity of the plaintext, needed to restore it after decryption.
     */
    struct OriginalFileDescriptor
    {
        std::string originalName{};
        std::string originalType{};
        std::uint64_t originalSize{0};
        std::int64_t originalLastModified{0};
    };
    BOOST_DESCRIBE_STRUCT(
        OriginalFileDescriptor,
        (),
        (originalName, originalType, originalSize, originalLastModified))

    struct EncryptionMetadata
    {
        std::string algorithm{"AES-GCM"};
        int keyLength{256};
        int ivLength{12};
        int pbkdf2Iterations{100'000};
        std::vector<std::uint8_t> salt{};
        std::vector<std::uint8_t> iv{};
        std::string version{"1.0"};
        std::int64_t timestamp{0};
        OriginalFileDescriptor originalMetadata{};
    };
    BOOST_DESCRIBE_STRUCT(
        EncryptionMetadata,
        (),
        (algorithm, keyLength, ivLength, pbkdf2Iterations, salt, iv, version, timestamp, originalMetadata))
}

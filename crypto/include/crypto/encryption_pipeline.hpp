#pragma once

#include <crypto/crypto_error.hpp>
#include <crypto/derived_key.hpp>
#include <shared_data/transfer/encryption_metadata.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Crypto
{
    using Bytes = std::vector<std::uint8_t>;

    struct EncryptedPayload
    {
        /// ciphertext followed by the 16 byte authentication tag.
        Bytes ciphertext{};
        SharedData::EncryptionMetadata metadata{};
    };

    /**
     * @brief AES-256-GCM with a PBKDF2-HMAC-SHA-256 derived key. Every encryption uses a fresh salt and IV.
     * The only shared state is the metadata cache, which is guarded by a mutex.
     */
    class EncryptionPipeline
    {
      public:
        constexpr static std::size_t minimumSecretLength = 8;
        constexpr static std::size_t saltLength = 32;
        constexpr static std::size_t ivLength = 12;
        constexpr static std::size_t tagLength = 16;
        constexpr static int iterations = 100'000;
        constexpr static char const* algorithm = "AES-GCM";
        constexpr static char const* formatVersion = "1.0";
        constexpr static std::size_t defaultChunkSize = 64 * 1024 * 1024;
        constexpr static std::size_t maximumChunkSize = 1024 * 1024 * 1024;

        /**
         * @param chunkSize Largest piece handed to the cipher in one call.
         */
        explicit EncryptionPipeline(std::size_t chunkSize = defaultChunkSize);

        static std::expected<void, CryptoError> validateSecret(std::string_view secret);

        static std::expected<DerivedKey, CryptoError>
        deriveKey(std::string_view secret, std::span<std::uint8_t const> salt, int iterationCount);

        /**
         * @brief Encrypts a payload.
         *
         * @param plaintext The bytes to encrypt.
         * @param secret The user secret, at least minimumSecretLength characters.
         * @param original Identity of the plaintext, stored in the metadata.
         */
        std::expected<EncryptedPayload, CryptoError> encrypt(
            std::span<std::uint8_t const> plaintext,
            std::string_view secret,
            SharedData::OriginalFileDescriptor const& original) const;

        /**
         * @brief Decrypts a payload produced by encrypt. A wrong secret and a tampered payload both fail with
         * AuthenticationFailed.
         */
        std::expected<Bytes, CryptoError> decrypt(
            std::span<std::uint8_t const> ciphertext,
            SharedData::EncryptionMetadata const& metadata,
            std::string_view secret) const;

        /**
         * @brief Encrypts and decrypts a fixed text with the secret and compares the result.
         */
        std::expected<void, CryptoError> selfTest(std::string_view secret) const;

        /**
         * @brief Encrypts a local file into target and returns the metadata needed to decrypt it.
         */
        std::expected<SharedData::EncryptionMetadata, CryptoError>
        encryptFile(std::filesystem::path const& source, std::filesystem::path const& target, std::string_view secret)
            const;
        std::expected<void, CryptoError> decryptFile(
            std::filesystem::path const& source,
            SharedData::EncryptionMetadata const& metadata,
            std::filesystem::path const& target,
            std::string_view secret) const;

        void rememberMetadata(std::string const& name, SharedData::EncryptionMetadata const& metadata);
        std::optional<SharedData::EncryptionMetadata> cachedMetadata(std::string const& name) const;
        void forgetMetadata(std::string const& name);
        void clearMetadataCache();
        std::size_t cachedMetadataCount() const;

      private:
        static std::expected<void, CryptoError> validateMetadata(
            SharedData::EncryptionMetadata const& metadata,
            std::size_t ciphertextSize);

      private:
        std::size_t chunkSize_;
        mutable std::mutex cacheMutex_{};
        std::unordered_map<std::string, SharedData::EncryptionMetadata> metadataCache_{};
    };
}

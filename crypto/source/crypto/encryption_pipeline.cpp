#include <crypto/encryption_pipeline.hpp>
#include <log/log.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>

namespace Crypto
{
    namespace
    {
        struct CipherContextDeleter
        {
            void operator()(EVP_CIPHER_CTX* context) const
            {
                EVP_CIPHER_CTX_free(context);
            }
        };
        using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

        std::expected<CipherContext, CryptoError>
        makeContext(bool encrypt, DerivedKey const& key, std::span<std::uint8_t const> iv)
        {
            CipherContext context{EVP_CIPHER_CTX_new()};
            if (!context)
                return std::unexpected(
                    CryptoError{.type = CryptoErrorType::CipherFailure, .message = "Cannot allocate cipher context"});

            const auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
            if (init(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
                EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) !=
                    1 ||
                init(context.get(), nullptr, nullptr, key.data(), iv.data()) != 1)
            {
                return std::unexpected(
                    CryptoError{.type = CryptoErrorType::CipherFailure, .message = "Cannot initialize AES-GCM"});
            }
            return context;
        }

        using CipherUpdate = int (*)(EVP_CIPHER_CTX*, unsigned char*, int*, unsigned char const*, int);

        /**
         * @brief Feeds the input to the cipher in pieces of at most chunkSize bytes, the EVP interface takes int
         * lengths.
         *
         * @return The number of bytes written to output.
         */
        std::optional<std::size_t> updateInChunks(
            EVP_CIPHER_CTX* context,
            CipherUpdate update,
            std::span<std::uint8_t const> input,
            std::uint8_t* output,
            std::size_t chunkSize)
        {
            std::size_t total = 0;
            for (std::size_t offset = 0; offset < input.size(); offset += chunkSize)
            {
                const auto length = std::min(chunkSize, input.size() - offset);
                int written = 0;
                if (update(context, output + total, &written, input.data() + offset, static_cast<int>(length)) != 1)
                    return std::nullopt;
                total += static_cast<std::size_t>(written);
            }
            return total;
        }

        std::expected<Bytes, CryptoError> randomBytes(std::size_t count)
        {
            Bytes bytes(count);
            if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
                return std::unexpected(
                    CryptoError{.type = CryptoErrorType::RandomFailure, .message = "RAND_bytes failed"});
            return bytes;
        }

        std::expected<Bytes, CryptoError> readFile(std::filesystem::path const& path)
        {
            std::ifstream reader{path, std::ios_base::binary};
            if (!reader.good())
                return std::unexpected(
                    CryptoError{.type = CryptoErrorType::FileError, .message = "Cannot open " + path.string()});
            return Bytes{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
        }

        std::expected<void, CryptoError> writeFile(std::filesystem::path const& path, Bytes const& bytes)
        {
            std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
            writer.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!writer.good())
                return std::unexpected(
                    CryptoError{.type = CryptoErrorType::FileError, .message = "Cannot write " + path.string()});
            return {};
        }

        std::int64_t millisecondsSinceEpoch(std::chrono::system_clock::time_point timePoint)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
        }
    }

    EncryptionPipeline::EncryptionPipeline(std::size_t chunkSize)
        : chunkSize_{std::clamp<std::size_t>(chunkSize, 1, maximumChunkSize)}
    {}

    std::expected<void, CryptoError> EncryptionPipeline::validateSecret(std::string_view secret)
    {
        if (secret.size() < minimumSecretLength)
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::SecretTooShort,
                .message = fmt::format("The secret must be at least {} characters long", minimumSecretLength),
            });
        return {};
    }

    std::expected<DerivedKey, CryptoError>
    EncryptionPipeline::deriveKey(std::string_view secret, std::span<std::uint8_t const> salt, int iterationCount)
    {
        if (auto valid = validateSecret(secret); !valid)
            return std::unexpected(valid.error());

        DerivedKey key{};
        if (PKCS5_PBKDF2_HMAC(
                secret.data(),
                static_cast<int>(secret.size()),
                salt.data(),
                static_cast<int>(salt.size()),
                iterationCount,
                EVP_sha256(),
                static_cast<int>(DerivedKey::size),
                key.data()) != 1)
        {
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::KeyDerivationFailed, .message = "PKCS5_PBKDF2_HMAC failed"});
        }
        return key;
    }

    std::expected<EncryptedPayload, CryptoError> EncryptionPipeline::encrypt(
        std::span<std::uint8_t const> plaintext,
        std::string_view secret,
        SharedData::OriginalFileDescriptor const& original) const
    {
        if (auto valid = validateSecret(secret); !valid)
            return std::unexpected(valid.error());

        auto salt = randomBytes(saltLength);
        if (!salt)
            return std::unexpected(salt.error());
        auto iv = randomBytes(ivLength);
        if (!iv)
            return std::unexpected(iv.error());

        auto key = deriveKey(secret, *salt, iterations);
        if (!key)
            return std::unexpected(key.error());

        auto context = makeContext(true, *key, *iv);
        if (!context)
            return std::unexpected(context.error());

        Bytes ciphertext(plaintext.size() + tagLength);
        const auto written = updateInChunks(context->get(), &EVP_EncryptUpdate, plaintext, ciphertext.data(), chunkSize_);
        if (!written)
        {
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "EVP_EncryptUpdate failed"});
        }
        int finalWritten = 0;
        if (EVP_EncryptFinal_ex(context->get(), ciphertext.data() + *written, &finalWritten) != 1)
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "EVP_EncryptFinal_ex failed"});

        const auto bodySize = *written + static_cast<std::size_t>(finalWritten);
        if (bodySize != plaintext.size())
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::CipherFailure,
                .message = fmt::format("Encrypted {} of {} bytes", bodySize, plaintext.size()),
            });
        if (EVP_CIPHER_CTX_ctrl(
                context->get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tagLength), ciphertext.data() + bodySize) != 1)
        {
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "Cannot read the GCM tag"});
        }
        ciphertext.resize(bodySize + tagLength);

        return EncryptedPayload{
            .ciphertext = std::move(ciphertext),
            .metadata =
                SharedData::EncryptionMetadata{
                    .algorithm = algorithm,
                    .keyLength = static_cast<int>(DerivedKey::size * 8),
                    .ivLength = static_cast<int>(ivLength),
                    .pbkdf2Iterations = iterations,
                    .salt = std::move(*salt),
                    .iv = std::move(*iv),
                    .version = formatVersion,
                    .timestamp = millisecondsSinceEpoch(std::chrono::system_clock::now()),
                    .originalMetadata = original,
                },
        };
    }

    std::expected<void, CryptoError>
    EncryptionPipeline::validateMetadata(SharedData::EncryptionMetadata const& metadata, std::size_t ciphertextSize)
    {
        if (metadata.salt.empty() || metadata.iv.empty())
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::MissingMetadata, .message = "Salt or IV is missing"});
        if (metadata.algorithm != algorithm)
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::InvalidMetadata,
                .message = fmt::format("Unsupported algorithm '{}'", metadata.algorithm),
            });
        if (metadata.iv.size() != ivLength)
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::InvalidMetadata,
                .message = fmt::format("IV must be {} bytes, got {}", ivLength, metadata.iv.size()),
            });
        if (metadata.salt.size() != saltLength)
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::InvalidMetadata,
                .message = fmt::format("Salt must be {} bytes, got {}", saltLength, metadata.salt.size()),
            });
        if (metadata.pbkdf2Iterations < iterations)
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::InvalidMetadata,
                .message = fmt::format(
                    "At least {} PBKDF2 iterations are required, got {}", iterations, metadata.pbkdf2Iterations),
            });
        if (ciphertextSize < tagLength)
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::InvalidMetadata, .message = "Ciphertext is shorter than a tag"});
        return {};
    }

    std::expected<Bytes, CryptoError> EncryptionPipeline::decrypt(
        std::span<std::uint8_t const> ciphertext,
        SharedData::EncryptionMetadata const& metadata,
        std::string_view secret) const
    {
        if (auto valid = validateSecret(secret); !valid)
            return std::unexpected(valid.error());
        if (auto valid = validateMetadata(metadata, ciphertext.size()); !valid)
            return std::unexpected(valid.error());

        auto key = deriveKey(secret, metadata.salt, metadata.pbkdf2Iterations);
        if (!key)
            return std::unexpected(key.error());

        auto context = makeContext(false, *key, metadata.iv);
        if (!context)
            return std::unexpected(context.error());

        const auto body = ciphertext.first(ciphertext.size() - tagLength);
        auto tag = Bytes{ciphertext.end() - static_cast<std::ptrdiff_t>(tagLength), ciphertext.end()};

        Bytes plaintext(body.size() + tagLength);
        const auto written = updateInChunks(context->get(), &EVP_DecryptUpdate, body, plaintext.data(), chunkSize_);
        if (!written)
        {
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "EVP_DecryptUpdate failed"});
        }
        if (EVP_CIPHER_CTX_ctrl(context->get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "Cannot set the GCM tag"});

        int finalWritten = 0;
        if (EVP_DecryptFinal_ex(context->get(), plaintext.data() + *written, &finalWritten) != 1)
        {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
            return std::unexpected(CryptoError{
                .type = CryptoErrorType::AuthenticationFailed,
                .message = "Wrong secret or modified ciphertext",
            });
        }
        plaintext.resize(*written + static_cast<std::size_t>(finalWritten));
        return plaintext;
    }

    std::expected<void, CryptoError> EncryptionPipeline::selfTest(std::string_view secret) const
    {
        constexpr std::string_view sample = "vaultline encryption self test";
        const auto sampleBytes =
            std::span<std::uint8_t const>{reinterpret_cast<std::uint8_t const*>(sample.data()), sample.size()};

        auto encrypted = encrypt(
            sampleBytes,
            secret,
            SharedData::OriginalFileDescriptor{
                .originalName = "self_test.txt",
                .originalType = "text/plain",
                .originalSize = sample.size(),
            });
        if (!encrypted)
            return std::unexpected(encrypted.error());

        auto decrypted = decrypt(encrypted->ciphertext, encrypted->metadata, secret);
        if (!decrypted)
            return std::unexpected(decrypted.error());

        if (!std::equal(decrypted->begin(), decrypted->end(), sampleBytes.begin(), sampleBytes.end()))
            return std::unexpected(
                CryptoError{.type = CryptoErrorType::CipherFailure, .message = "Round trip produced different data"});

        Log::debug("EncryptionPipeline: Self test passed.");
        return {};
    }

    std::expected<SharedData::EncryptionMetadata, CryptoError> EncryptionPipeline::encryptFile(
        std::filesystem::path const& source,
        std::filesystem::path const& target,
        std::string_view secret) const
    {
        if (auto valid = validateSecret(secret); !valid)
            return std::unexpected(valid.error());

        auto plaintext = readFile(source);
        if (!plaintext)
            return std::unexpected(plaintext.error());

        std::error_code ec;
        const auto lastWrite = std::filesystem::last_write_time(source, ec);
        const auto lastModified =
            ec ? std::int64_t{0}
               : millisecondsSinceEpoch(std::chrono::file_clock::to_sys(lastWrite));

        auto encrypted = encrypt(
            *plaintext,
            secret,
            SharedData::OriginalFileDescriptor{
                .originalName = source.filename().string(),
                .originalType = "application/octet-stream",
                .originalSize = plaintext->size(),
                .originalLastModified = lastModified,
            });
        OPENSSL_cleanse(plaintext->data(), plaintext->size());
        if (!encrypted)
            return std::unexpected(encrypted.error());

        if (auto written = writeFile(target, encrypted->ciphertext); !written)
            return std::unexpected(written.error());

        Log::info(
            "EncryptionPipeline: Encrypted '{}' into '{}' ({} bytes).",
            source.string(),
            target.string(),
            encrypted->ciphertext.size());
        return encrypted->metadata;
    }

    std::expected<void, CryptoError> EncryptionPipeline::decryptFile(
        std::filesystem::path const& source,
        SharedData::EncryptionMetadata const& metadata,
        std::filesystem::path const& target,
        std::string_view secret) const
    {
        auto ciphertext = readFile(source);
        if (!ciphertext)
            return std::unexpected(ciphertext.error());

        auto plaintext = decrypt(*ciphertext, metadata, secret);
        if (!plaintext)
            return std::unexpected(plaintext.error());

        auto written = writeFile(target, *plaintext);
        OPENSSL_cleanse(plaintext->data(), plaintext->size());
        return written;
    }

    void EncryptionPipeline::rememberMetadata(std::string const& name, SharedData::EncryptionMetadata const& metadata)
    {
        std::scoped_lock lock{cacheMutex_};
        metadataCache_.insert_or_assign(name, metadata);
    }

    std::optional<SharedData::EncryptionMetadata> EncryptionPipeline::cachedMetadata(std::string const& name) const
    {
        std::scoped_lock lock{cacheMutex_};
        if (auto iter = metadataCache_.find(name); iter != metadataCache_.end())
            return iter->second;
        return std::nullopt;
    }

    void EncryptionPipeline::forgetMetadata(std::string const& name)
    {
        std::scoped_lock lock{cacheMutex_};
        metadataCache_.erase(name);
    }

    void EncryptionPipeline::clearMetadataCache()
    {
        std::scoped_lock lock{cacheMutex_};
        metadataCache_.clear();
    }

    std::size_t EncryptionPipeline::cachedMetadataCount() const
    {
        std::scoped_lock lock{cacheMutex_};
        return metadataCache_.size();
    }
}

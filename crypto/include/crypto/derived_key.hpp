#pragma once

#include <openssl/crypto.h>

#include <array>
#include <cstdint>

namespace Crypto
{
    /**
     * @brief 256 bit key that is wiped when it goes out of scope.
     */
    class DerivedKey
    {
      public:
        constexpr static std::size_t size = 32;

        DerivedKey() = default;
        ~DerivedKey()
        {
            OPENSSL_cleanse(bytes_.data(), bytes_.size());
        }
        DerivedKey(DerivedKey const&) = delete;
        DerivedKey& operator=(DerivedKey const&) = delete;
        DerivedKey(DerivedKey&& other) noexcept
            : bytes_{other.bytes_}
        {
            OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
        }
        DerivedKey& operator=(DerivedKey&& other) noexcept
        {
            if (this != &other)
            {
                bytes_ = other.bytes_;
                OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
            }
            return *this;
        }

        std::uint8_t* data()
        {
            return bytes_.data();
        }
        std::uint8_t const* data() const
        {
            return bytes_.data();
        }

      private:
        std::array<std::uint8_t, size> bytes_{};
    };
}

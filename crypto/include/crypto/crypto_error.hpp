#pragma once

#include <utility/describe.hpp>

#include <fmt/format.h>

#include <string>

namespace Crypto
{
    BOOST_DEFINE_ENUM_CLASS(
        CryptoErrorType,
        SecretTooShort,
        MissingMetadata,
        InvalidMetadata,
        AuthenticationFailed,
        RandomFailure,
        KeyDerivationFailed,
        CipherFailure,
        FileError)

    struct CryptoError
    {
        CryptoErrorType type{CryptoErrorType::CipherFailure};
        std::string message{};

        std::string toString() const
        {
            const auto enumString = boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE");
            if (message.empty())
                return enumString;
            return fmt::format("{}: {}", enumString, message);
        }
    };
}

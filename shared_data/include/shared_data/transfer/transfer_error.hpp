#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        TransferErrorType,
        Validation,
        Transient,
        Negotiation,
        Transfer,
        Commit,
        Timeout,
        Authentication,
        Integrity,
        Encryption,
        PayloadUnavailable,
        Interrupted,
        Implementation)

    struct TransferError
    {
        TransferErrorType type{TransferErrorType::Implementation};
        std::string message{};
        std::optional<int> httpStatus{std::nullopt};

        /**
         * @brief Errors of this kind are worth another attempt.
         */
        bool isTransient() const
        {
            return type == TransferErrorType::Transient || type == TransferErrorType::Timeout;
        }

        std::string toString() const
        {
            const auto enumString = boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE");
            if (httpStatus)
                return fmt::format("{} (HTTP {}): {}", enumString, *httpStatus, message);
            if (message.empty())
                return enumString;
            return fmt::format("{}: {}", enumString, message);
        }
    };
    BOOST_DESCRIBE_STRUCT(TransferError, (), (type, message, httpStatus))
}

#include <transfer/backend_api.hpp>

#include <fmt/format.h>

namespace Transfer
{
    std::string BackendError::toString() const
    {
        if (timedOut)
            return fmt::format("timed out: {}", message);
        if (httpStatus == 0)
            return fmt::format("network error: {}", message);
        return fmt::format("HTTP {}: {}", httpStatus, message);
    }

    SharedData::TransferError toTransferError(BackendError const& error, SharedData::TransferErrorType permanentType)
    {
        using enum SharedData::TransferErrorType;

        auto type = permanentType;
        if (error.timedOut)
            type = Timeout;
        else if (error.httpStatus == 401 || error.httpStatus == 403)
            type = Authentication;
        else if (error.isTransient())
            type = Transient;

        return SharedData::TransferError{
            .type = type,
            .message = error.message,
            .httpStatus = error.httpStatus == 0 ? std::nullopt : std::optional<int>{error.httpStatus},
        };
    }
}

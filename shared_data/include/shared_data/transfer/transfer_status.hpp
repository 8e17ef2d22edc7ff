#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(OperationKind, Upload, Delete)

    BOOST_DEFINE_ENUM_CLASS(UploadStatus, Queued, Uploading, Completed, Failed, Cancelled)

    BOOST_DEFINE_ENUM_CLASS(DeleteStatus, Queued, Deleting, Completed, Failed)

    bool isTerminal(UploadStatus status);
    bool isTerminal(DeleteStatus status);

    /**
     * @brief Whether the state machine allows moving from one status to another.
     * Staying in the same non terminal status is allowed, nothing leaves a terminal status.
     */
    bool isValidTransition(UploadStatus from, UploadStatus to);
    bool isValidTransition(DeleteStatus from, DeleteStatus to);
}

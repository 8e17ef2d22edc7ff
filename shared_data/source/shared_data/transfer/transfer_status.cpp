#include <shared_data/transfer/transfer_status.hpp>

namespace SharedData
{
    bool isTerminal(UploadStatus status)
    {
        return status == UploadStatus::Completed || status == UploadStatus::Failed ||
            status == UploadStatus::Cancelled;
    }
    bool isTerminal(DeleteStatus status)
    {
        return status == DeleteStatus::Completed || status == DeleteStatus::Failed;
    }

    bool isValidTransition(UploadStatus from, UploadStatus to)
    {
        using enum UploadStatus;
        switch (from)
        {
            case Queued:
                return to != Completed;
            case Uploading:
                return to != Queued;
            case Completed:
            case Failed:
            case Cancelled:
                return false;
        }
        return false;
    }
    bool isValidTransition(DeleteStatus from, DeleteStatus to)
    {
        using enum DeleteStatus;
        switch (from)
        {
            case Queued:
                return to != Completed;
            case Deleting:
                return to != Queued;
            case Completed:
            case Failed:
                return false;
        }
        return false;
    }
}

#include <shared_data/transfer/queue_record.hpp>
#include <utility/overloaded.hpp>

namespace SharedData
{
    bool QueueRecord::isTerminal() const
    {
        return std::visit(
            [](auto const& fields) {
                return SharedData::isTerminal(fields.status);
            },
            body);
    }
    bool QueueRecord::isQueued() const
    {
        return std::visit(
            Utility::overloaded{
                [](UploadRecord const& upload) {
                    return upload.status == UploadStatus::Queued;
                },
                [](DeleteRecord const& deletion) {
                    return deletion.status == DeleteStatus::Queued;
                },
            },
            body);
    }
    bool QueueRecord::isActive() const
    {
        return std::visit(
            Utility::overloaded{
                [](UploadRecord const& upload) {
                    return upload.status == UploadStatus::Uploading;
                },
                [](DeleteRecord const& deletion) {
                    return deletion.status == DeleteStatus::Deleting;
                },
            },
            body);
    }

    void to_json(nlohmann::json& j, QueueRecord const& record)
    {
        j = nlohmann::json::object();
        j["id"] = record.id;
        j["sequence"] = record.sequence;
        j["createdAt"] = record.createdAt;
        j["updatedAt"] = record.updatedAt;
        if (record.error)
            j["error"] = *record.error;
        j["kind"] = record.kind();
        std::visit(
            Utility::overloaded{
                [&j](UploadRecord const& upload) {
                    j["upload"] = upload;
                },
                [&j](DeleteRecord const& deletion) {
                    j["delete"] = deletion;
                },
            },
            record.body);
    }
    void from_json(nlohmann::json const& j, QueueRecord& record)
    {
        record.id = j.at("id").get<Ids::ItemId>();
        record.sequence = j.at("sequence").get<std::uint64_t>();
        record.createdAt = j.at("createdAt").get<std::chrono::system_clock::time_point>();
        if (j.contains("updatedAt"))
            record.updatedAt = j.at("updatedAt").get<std::chrono::system_clock::time_point>();
        else
            record.updatedAt = record.createdAt;
        if (j.contains("error") && !j.at("error").is_null())
            record.error = j.at("error").get<TransferError>();
        else
            record.error = std::nullopt;

        switch (j.at("kind").get<OperationKind>())
        {
            case OperationKind::Upload:
                record.body = j.at("upload").get<UploadRecord>();
                break;
            case OperationKind::Delete:
                record.body = j.at("delete").get<DeleteRecord>();
                break;
        }
    }
}

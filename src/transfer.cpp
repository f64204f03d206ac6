#include "bulkcp/transfer.hpp"
#include "bulkcp/storage/url.hpp"

#include <nlohmann/json.hpp>

namespace bulkcp {

const char* disposition_name(Disposition disposition) {
    switch (disposition) {
        case Disposition::OntoPath: return "onto";
        case Disposition::IntoDirectory: return "into";
    }
    return "unknown";
}

const char* task_kind_name(TaskKind kind) {
    switch (kind) {
        case TaskKind::Whole: return "whole";
        case TaskKind::Part: return "part";
        case TaskKind::Finalize: return "finalize";
    }
    return "unknown";
}

TransferSpec::TransferSpec(std::string source, std::string destination, Disposition disposition)
    : source_(std::move(source))
    , destination_(std::move(destination))
    , disposition_(disposition) {}

std::string TransferSpec::final_destination() const {
    if (disposition_ == Disposition::IntoDirectory) {
        return url::join(destination_, url::basename(source_));
    }
    return destination_;
}

ParseTransfersResult parse_transfers(const std::string& json) {
    ParseTransfersResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const std::exception& e) {
        result.fail(ErrorCode::InvalidTransfer, std::string("invalid JSON: ") + e.what());
        return result;
    }

    if (!j.is_array()) {
        result.fail(ErrorCode::InvalidTransfer, "transfer list must be a JSON array");
        return result;
    }

    for (size_t i = 0; i < j.size(); ++i) {
        const auto& item = j[i];
        std::string where = "transfer " + std::to_string(i);

        if (!item.is_object()) {
            result.fail(ErrorCode::InvalidTransfer, where + ": expected an object");
            return result;
        }
        if (!item.contains("from") || !item["from"].is_string() ||
            item["from"].get<std::string>().empty()) {
            result.fail(ErrorCode::InvalidTransfer, where + ": 'from' must be a non-empty string");
            return result;
        }

        bool has_to = item.contains("to");
        bool has_into = item.contains("into");
        if (has_to && has_into) {
            result.fail(ErrorCode::InvalidTransfer, where + ": specify only one of 'to' and 'into'");
            return result;
        }
        if (!has_to && !has_into) {
            result.fail(ErrorCode::InvalidTransfer, where + ": missing 'to' or 'into'");
            return result;
        }

        const char* key = has_to ? "to" : "into";
        if (!item[key].is_string() || item[key].get<std::string>().empty()) {
            result.fail(ErrorCode::InvalidTransfer,
                        where + ": '" + key + "' must be a non-empty string");
            return result;
        }

        result.transfers.emplace_back(item["from"].get<std::string>(),
                                      item[key].get<std::string>(),
                                      has_to ? Disposition::OntoPath : Disposition::IntoDirectory);
    }

    return result;
}

} // namespace bulkcp

#include "sync/validation_gate.hpp"

#include "core/codec.hpp"

#include <QJsonArray>

namespace atelier::sync {

bool is_inline_binary(QStringView text) {
    return text.startsWith(u"data:", Qt::CaseInsensitive);
}

std::optional<std::string> find_inline_binary(const QJsonValue& value, const std::string& path) {
    if (value.isString()) {
        if (is_inline_binary(value.toString())) {
            return path;
        }
        return std::nullopt;
    }
    if (value.isArray()) {
        const auto array = value.toArray();
        for (qsizetype i = 0; i < array.size(); ++i) {
            auto found = find_inline_binary(array.at(i), path + "[" + std::to_string(i) + "]");
            if (found) return found;
        }
        return std::nullopt;
    }
    if (value.isObject()) {
        const auto object = value.toObject();
        for (auto it = object.begin(); it != object.end(); ++it) {
            auto found = find_inline_binary(it.value(), path + "." + to_std(it.key()));
            if (found) return found;
        }
    }
    return std::nullopt;
}

Result<void, Error> ValidationGate::check_inline(const QJsonObject& payload) {
    if (auto path = find_inline_binary(QJsonValue(payload))) {
        return Result<void, Error>::err(Error{
            ErrorCode::ValidationRejected,
            "inline binary data at " + *path + "; externalize it before syncing"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ValidationGate::validate(const QJsonObject& payload) const {
    auto inline_check = check_inline(payload);
    if (inline_check.is_err()) {
        return inline_check;
    }

    const auto size = static_cast<std::size_t>(to_compact_json(payload).size());
    if (size > max_document_bytes_) {
        return Result<void, Error>::err(Error{
            ErrorCode::ValidationRejected,
            "document is " + std::to_string(size) + " bytes, limit is " +
                std::to_string(max_document_bytes_)});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ValidationGate::validate(const network::WriteBatch& batch) const {
    for (const auto& op : batch.ops()) {
        if (op.kind != network::WriteOp::Kind::Set) continue;
        auto result = validate(op.data);
        if (result.is_err()) {
            return Result<void, Error>::err(Error{ErrorCode::ValidationRejected,
                                                  op.path + ": " + result.unwrap_err().message});
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ValidationGate::check_history_item(const HistoryItem& item) {
    if (item.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "history item without id"});
    }
    if (item.image_url.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity,
                                              "history item " + item.id + " has no image"});
    }
    return Result<void, Error>::ok();
}

} // namespace atelier::sync

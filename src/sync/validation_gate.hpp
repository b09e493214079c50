#pragma once

#include "core/history.hpp"
#include "core/result.hpp"
#include "network/remote_store.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QStringView>
#include <cstddef>
#include <optional>
#include <string>

namespace atelier::sync {

/**
 * True for a self-describing inline payload ("data:image/png;base64,...").
 */
[[nodiscard]] bool is_inline_binary(QStringView text);

/**
 * JSON path of the first inline payload reachable from `value`, e.g.
 * "$.generatedModelHistory[3].imageUrl".
 */
[[nodiscard]] std::optional<std::string> find_inline_binary(const QJsonValue& value,
                                                            const std::string& path = "$");

/**
 * ValidationGate - Decides whether a payload may leave for the remote store.
 *
 * Rejections carry ErrorCode::ValidationRejected and name the offending
 * path. A rejected payload is never queued or written.
 */
class ValidationGate {
public:
    explicit ValidationGate(std::size_t max_document_bytes = 1024 * 1024)
        : max_document_bytes_(max_document_bytes) {}

    [[nodiscard]] std::size_t max_document_bytes() const { return max_document_bytes_; }

    /**
     * Reject inline binary data anywhere in `payload`. Applied to a whole
     * project state, which is split into many documents before writing.
     */
    [[nodiscard]] static Result<void, Error> check_inline(const QJsonObject& payload);

    /**
     * check_inline(), plus a ceiling on the compact encoding of a single
     * document.
     */
    [[nodiscard]] Result<void, Error> validate(const QJsonObject& payload) const;

    /**
     * validate() every document a batch would set, prefixing errors with
     * the document path.
     */
    [[nodiscard]] Result<void, Error> validate(const network::WriteBatch& batch) const;

    /**
     * Per-item filter for batch pushes: a history item needs an id and a
     * non-empty image reference. Failing items are skipped, not fatal.
     */
    [[nodiscard]] static Result<void, Error> check_history_item(const HistoryItem& item);

private:
    std::size_t max_document_bytes_;
};

} // namespace atelier::sync

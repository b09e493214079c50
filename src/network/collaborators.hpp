#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QObject>
#include <QString>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace atelier::network {

/**
 * Identity - The signed-in user, as supplied by the authentication provider.
 */
struct Identity {
    std::string user_id;

    bool operator==(const Identity&) const = default;
};

using UploadCallback = std::function<void(Res<std::string>)>;

/**
 * BlobStore - Object storage for large binary payloads.
 *
 * upload() returns a stable reference (an https:// or blob:// URL) that
 * replaces inline data in documents.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual void upload(QByteArray bytes, QString content_type, UploadCallback done) = 0;
    virtual void remove(const std::string& reference, std::function<void(Result<void, Error>)> done) = 0;
};

/**
 * MemoryBlobStore - In-process BlobStore completing on the event loop.
 */
class MemoryBlobStore : public QObject, public BlobStore {
    Q_OBJECT

public:
    explicit MemoryBlobStore(QObject* parent = nullptr) : QObject(parent) {}

    void upload(QByteArray bytes, QString content_type, UploadCallback done) override;
    void remove(const std::string& reference, std::function<void(Result<void, Error>)> done) override;

    void set_offline(bool offline) { offline_ = offline; }

    [[nodiscard]] bool contains(const std::string& reference) const { return blobs_.count(reference) > 0; }
    [[nodiscard]] size_t size() const { return blobs_.size(); }
    [[nodiscard]] std::optional<QByteArray> bytes(const std::string& reference) const;

private:
    struct Blob {
        QByteArray bytes;
        QString content_type;
    };

    std::map<std::string, Blob> blobs_;
    int next_id_ = 1;
    bool offline_ = false;
};

} // namespace atelier::network

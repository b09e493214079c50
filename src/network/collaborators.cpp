#include "network/collaborators.hpp"

#include <QTimer>

namespace atelier::network {

void MemoryBlobStore::upload(QByteArray bytes, QString content_type, UploadCallback done) {
    QTimer::singleShot(0, this, [this, bytes = std::move(bytes), content_type = std::move(content_type),
                                 done = std::move(done)]() {
        if (offline_) {
            done(Res<std::string>::err(Error{ErrorCode::RemoteUnavailable, "blob store unreachable"}));
            return;
        }
        const auto reference = "blob://atelier/" + std::to_string(next_id_++);
        blobs_[reference] = Blob{bytes, content_type};
        done(Res<std::string>::ok(reference));
    });
}

void MemoryBlobStore::remove(const std::string& reference, std::function<void(Result<void, Error>)> done) {
    QTimer::singleShot(0, this, [this, reference, done = std::move(done)]() {
        if (offline_) {
            done(Result<void, Error>::err(Error{ErrorCode::RemoteUnavailable, "blob store unreachable"}));
            return;
        }
        if (blobs_.erase(reference) == 0) {
            done(Result<void, Error>::err(Error{ErrorCode::NotFound, "no blob " + reference}));
            return;
        }
        done(Result<void, Error>::ok());
    });
}

std::optional<QByteArray> MemoryBlobStore::bytes(const std::string& reference) const {
    const auto it = blobs_.find(reference);
    if (it == blobs_.end()) return std::nullopt;
    return it->second.bytes;
}

} // namespace atelier::network

#pragma once
#include <ArduinoJson.h>
#include <deque>
#include <stddef.h>
#include <string>
#include <vector>

#include "farmlink/config.h"
#include "farmlink/remote_channel.h"

namespace farmlink
{

struct WriteRecord
{
    std::string path;
    std::string json;
    bool ok;
    std::string reason;
};

// In-process real-time store: a JSON object tree with per-key snapshot streams.
// Client writes are queued and applied on poll(), which also fires their callbacks;
// put() is the controller-side write and applies immediately.
class MemoryStore : public RemoteStateChannel
{
public:
    explicit MemoryStore(size_t capacity = FARMLINK_CFG_STORE_CAPACITY);

    SnapshotStreamPtr subscribe(const std::string &path) override;
    void unsubscribe(const SnapshotStreamPtr &stream) override;
    void write(const std::string &path, const std::string &json, WriteCallback done) override;

    bool put(const std::string &path, const std::string &json);
    // Serialized value at path ("null" and false when absent).
    bool read(const std::string &path, std::string &json) const;

    // Fault injection.
    void setOnline(bool online);
    bool isOnline() const { return online_; }
    void rejectPath(const std::string &path, const std::string &reason);
    void clearRejections();

    // Applies queued client writes in order. Writes issued from callbacks wait for the next poll.
    size_t poll();

    size_t pendingWrites() const { return queue_.size(); }
    size_t subscriberCount() const { return streams_.size(); }
    const std::deque<WriteRecord> &writeHistory() const { return history_; }
    void clearHistory() { history_.clear(); }

    static bool isValidPath(const std::string &path);

private:
    struct PendingWrite
    {
        std::string path;
        std::string json;
        WriteCallback done;
    };

    struct Rejection
    {
        std::string path;
        std::string reason;
    };

    bool apply(const std::string &path, const std::string &json, std::string &reason);
    void notifyAffected(const std::string &path);
    void pushCurrent(SnapshotStream &stream) const;
    const Rejection *findRejection(const std::string &path) const;
    void remember(const PendingWrite &w, const WriteOutcome &outcome);

    DynamicJsonDocument doc_;
    std::deque<PendingWrite> queue_;
    std::vector<SnapshotStreamPtr> streams_;
    std::vector<Rejection> rejections_;
    std::deque<WriteRecord> history_;
    bool online_ = true;
};

// Puts the default /controls (all off) and /schedule records where the store has none.
// Returns false when a record could not be encoded or stored.
bool memoryStore_seedDefaults(MemoryStore &store);

} // namespace farmlink

#pragma once
#include <functional>
#include <memory>
#include <stdint.h>
#include <string>

namespace farmlink
{

struct WriteOutcome
{
    bool ok = false;
    std::string reason; // empty when ok

    static WriteOutcome success() { return WriteOutcome{true, std::string()}; }
    static WriteOutcome failure(const std::string &why) { return WriteOutcome{false, why}; }
};

using WriteCallback = std::function<void(const WriteOutcome &)>;

// Whole-value snapshots of one store key. Holds at most one undelivered snapshot:
// a newer push replaces an older one (last value wins).
class SnapshotStream
{
public:
    explicit SnapshotStream(const std::string &path) : path_(path) {}

    const std::string &path() const { return path_; }
    bool isOpen() const { return open_; }

    // Producer side. Ignored once the stream is closed.
    void push(const std::string &payload);

    // Consumer side. Returns false when nothing is pending or the stream is closed.
    bool next(std::string &payload);

    // Returns true only for the call that actually closed the stream.
    bool close();

    uint32_t delivered() const { return delivered_; }
    uint32_t coalesced() const { return coalesced_; }

private:
    std::string path_;
    std::string pending_;
    bool hasPending_ = false;
    bool open_ = true;
    uint32_t delivered_ = 0;
    uint32_t coalesced_ = 0;
};

using SnapshotStreamPtr = std::shared_ptr<SnapshotStream>;

// Key-addressed remote store. Paths are '/'-separated keys such as "controls/feed".
// Contract: write callbacks are invoked later from the owner's loop, never from inside write().
class RemoteStateChannel
{
public:
    virtual ~RemoteStateChannel() = default;

    virtual SnapshotStreamPtr subscribe(const std::string &path) = 0;

    // Releasing an already released stream is a no-op.
    virtual void unsubscribe(const SnapshotStreamPtr &stream) = 0;

    // json is the serialized value to store at path.
    virtual void write(const std::string &path, const std::string &json, WriteCallback done) = 0;
};

} // namespace farmlink

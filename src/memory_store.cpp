#include "farmlink/memory_store.h"

#include <algorithm>

#include "farmlink/logger.h"
#include "farmlink/state_json.h"

namespace farmlink
{

namespace
{
static constexpr size_t kHistoryMax = 128;
static constexpr const char *kOfflineReason = "network offline";
static constexpr const char *kInvalidPathReason = "invalid path";
static constexpr const char *kInvalidPayloadReason = "invalid payload";
static constexpr const char *kStoreFullReason = "store full";

bool splitPath(const std::string &path, std::vector<std::string> &segments)
{
    segments.clear();
    std::string current;
    for (const char c : path)
    {
        if (c == '/')
        {
            if (current.empty())
            {
                return false;
            }
            segments.push_back(current);
            current.clear();
            continue;
        }
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                             c == '_' || c == '-';
        if (!allowed)
        {
            return false;
        }
        current.push_back(c);
    }
    if (current.empty())
    {
        return false;
    }
    segments.push_back(current);
    return true;
}

// Equal, ancestor or descendant paths see each other's writes.
bool pathsOverlap(const std::string &a, const std::string &b)
{
    if (a == b)
    {
        return true;
    }
    const std::string &shorter = a.size() < b.size() ? a : b;
    const std::string &longer = a.size() < b.size() ? b : a;
    return longer.compare(0, shorter.size(), shorter) == 0 && longer[shorter.size()] == '/';
}
} // namespace

MemoryStore::MemoryStore(size_t capacity) : doc_(capacity)
{
    doc_.to<JsonObject>();
}

bool MemoryStore::isValidPath(const std::string &path)
{
    std::vector<std::string> segments;
    return splitPath(path, segments);
}

SnapshotStreamPtr MemoryStore::subscribe(const std::string &path)
{
    SnapshotStreamPtr stream = std::make_shared<SnapshotStream>(path);
    if (!isValidPath(path))
    {
        FARMLINK_LOG_WARN(LogDomain::STORE, "subscribe rejected: invalid path '%s'", path.c_str());
        stream->close();
        return stream;
    }

    streams_.push_back(stream);
    pushCurrent(*stream);
    FARMLINK_LOG_DEBUG(LogDomain::STORE, "subscribed %s (%u open)", path.c_str(), (unsigned)streams_.size());
    return stream;
}

void MemoryStore::unsubscribe(const SnapshotStreamPtr &stream)
{
    if (!stream)
    {
        return;
    }
    auto it = std::find(streams_.begin(), streams_.end(), stream);
    if (it != streams_.end())
    {
        streams_.erase(it);
        FARMLINK_LOG_DEBUG(LogDomain::STORE, "unsubscribed %s (%u open)", stream->path().c_str(), (unsigned)streams_.size());
    }
    stream->close();
}

void MemoryStore::write(const std::string &path, const std::string &json, WriteCallback done)
{
    queue_.push_back(PendingWrite{path, json, std::move(done)});
}

bool MemoryStore::put(const std::string &path, const std::string &json)
{
    std::string reason;
    if (!apply(path, json, reason))
    {
        FARMLINK_LOG_WARN(LogDomain::STORE, "put %s failed: %s", path.c_str(), reason.c_str());
        return false;
    }
    notifyAffected(path);
    return true;
}

bool MemoryStore::read(const std::string &path, std::string &json) const
{
    json = "null";
    std::vector<std::string> segments;
    if (!splitPath(path, segments))
    {
        return false;
    }

    JsonVariantConst node = doc_.as<JsonVariantConst>();
    for (const std::string &segment : segments)
    {
        if (!node.is<JsonObjectConst>())
        {
            return false;
        }
        node = node[segment];
    }
    if (node.isNull())
    {
        return false;
    }

    json.clear();
    serializeJson(node, json);
    return true;
}

void MemoryStore::setOnline(bool online)
{
    if (online_ == online)
    {
        return;
    }
    online_ = online;
    FARMLINK_LOG_INFO(LogDomain::STORE, "store %s", online ? "online" : "offline");
}

void MemoryStore::rejectPath(const std::string &path, const std::string &reason)
{
    for (Rejection &r : rejections_)
    {
        if (r.path == path)
        {
            r.reason = reason;
            return;
        }
    }
    rejections_.push_back(Rejection{path, reason});
}

void MemoryStore::clearRejections()
{
    rejections_.clear();
}

size_t MemoryStore::poll()
{
    if (queue_.empty())
    {
        return 0;
    }

    std::deque<PendingWrite> batch;
    batch.swap(queue_);

    size_t processed = 0;
    for (PendingWrite &w : batch)
    {
        WriteOutcome outcome;
        std::string reason;
        const Rejection *rejection = nullptr;
        if (!online_)
        {
            outcome = WriteOutcome::failure(kOfflineReason);
        }
        else if ((rejection = findRejection(w.path)) != nullptr)
        {
            outcome = WriteOutcome::failure(rejection->reason);
        }
        else if (!apply(w.path, w.json, reason))
        {
            outcome = WriteOutcome::failure(reason);
        }
        else
        {
            outcome = WriteOutcome::success();
            notifyAffected(w.path);
        }

        remember(w, outcome);
        if (outcome.ok)
        {
            FARMLINK_LOG_DEBUG(LogDomain::STORE, "write %s = %s", w.path.c_str(), w.json.c_str());
        }
        else
        {
            FARMLINK_LOG_WARN(LogDomain::STORE, "write %s failed: %s", w.path.c_str(), outcome.reason.c_str());
        }

        if (w.done)
        {
            w.done(outcome);
        }
        ++processed;
    }
    return processed;
}

bool MemoryStore::apply(const std::string &path, const std::string &json, std::string &reason)
{
    std::vector<std::string> segments;
    if (!splitPath(path, segments))
    {
        reason = kInvalidPathReason;
        return false;
    }

    DynamicJsonDocument value(json.size() * 4 + 256);
    if (deserializeJson(value, json))
    {
        reason = kInvalidPayloadReason;
        return false;
    }

    // Overwritten values stay in the pool until collected.
    doc_.garbageCollect();

    JsonObject parent = doc_.as<JsonObject>();
    for (size_t i = 0; i + 1 < segments.size(); ++i)
    {
        const std::string &segment = segments[i];
        if (parent[segment].is<JsonObject>())
        {
            parent = parent[segment].as<JsonObject>();
        }
        else
        {
            parent = parent.createNestedObject(segment);
        }
        if (parent.isNull())
        {
            reason = kStoreFullReason;
            return false;
        }
    }

    const std::string &leaf = segments.back();
    if (value.isNull())
    {
        parent.remove(leaf);
        return true;
    }
    if (!parent[leaf].set(value.as<JsonVariantConst>()) || doc_.overflowed())
    {
        reason = kStoreFullReason;
        return false;
    }
    return true;
}

void MemoryStore::notifyAffected(const std::string &path)
{
    for (const SnapshotStreamPtr &stream : streams_)
    {
        if (stream->isOpen() && pathsOverlap(stream->path(), path))
        {
            pushCurrent(*stream);
        }
    }
}

void MemoryStore::pushCurrent(SnapshotStream &stream) const
{
    std::string json;
    read(stream.path(), json);
    stream.push(json);
}

const MemoryStore::Rejection *MemoryStore::findRejection(const std::string &path) const
{
    for (const Rejection &r : rejections_)
    {
        if (pathsOverlap(r.path, path) && path.size() >= r.path.size())
        {
            return &r;
        }
    }
    return nullptr;
}

void MemoryStore::remember(const PendingWrite &w, const WriteOutcome &outcome)
{
    history_.push_back(WriteRecord{w.path, w.json, outcome.ok, outcome.reason});
    while (history_.size() > kHistoryMax)
    {
        history_.pop_front();
    }
}

bool memoryStore_seedDefaults(MemoryStore &store)
{
    std::string json;
    if (!store.read(kControlsPath, json))
    {
        if (encodeControls(ControlState(), json) != StateJsonError::OK || !store.put(kControlsPath, json))
        {
            FARMLINK_LOG_ERROR(LogDomain::STORE, "could not seed %s", kControlsPath);
            return false;
        }
        FARMLINK_LOG_DEBUG(LogDomain::STORE, "seeded %s", kControlsPath);
    }
    if (!store.read(kSchedulePath, json))
    {
        if (encodeSchedule(schedule_defaults(), json) != StateJsonError::OK || !store.put(kSchedulePath, json))
        {
            FARMLINK_LOG_ERROR(LogDomain::STORE, "could not seed %s", kSchedulePath);
            return false;
        }
        FARMLINK_LOG_DEBUG(LogDomain::STORE, "seeded %s", kSchedulePath);
    }
    return true;
}

} // namespace farmlink

#include "farmlink/remote_channel.h"

namespace farmlink
{

void SnapshotStream::push(const std::string &payload)
{
    if (!open_)
    {
        return;
    }
    if (hasPending_)
    {
        ++coalesced_;
    }
    pending_ = payload;
    hasPending_ = true;
}

bool SnapshotStream::next(std::string &payload)
{
    if (!open_ || !hasPending_)
    {
        return false;
    }
    payload.swap(pending_);
    pending_.clear();
    hasPending_ = false;
    ++delivered_;
    return true;
}

bool SnapshotStream::close()
{
    if (!open_)
    {
        return false;
    }
    open_ = false;
    hasPending_ = false;
    pending_.clear();
    return true;
}

} // namespace farmlink

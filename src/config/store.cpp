//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/store.cpp
// Purpose: Swap configuration snapshots atomically so a reload delivered from
//          another thread never exposes a half-built configuration.
// Key invariants: current_ is never null.
// Ownership/Lifetime: Snapshots stay alive while any reader holds them.
//
//===----------------------------------------------------------------------===//

#include "keyview/config/store.hpp"

#include <utility>

namespace keyview::config
{

ConfigStore::ConfigStore(Snapshot initial)
{
    if (initial)
    {
        current_ = std::move(initial);
    }
}

void ConfigStore::publish(Snapshot next)
{
    if (!next)
    {
        next = std::make_shared<const Configuration>();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(next);
    ++generation_;
    // `next` now holds the previous snapshot and is released outside the
    // caller's view once the lock is dropped.
}

Snapshot ConfigStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::uint64_t ConfigStore::generation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace keyview::config

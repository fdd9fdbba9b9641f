// include/keyview/config/store.hpp
// @brief Holder for the current configuration snapshot.
// @invariant Readers observe either the previous or the newly published
//            snapshot in full, never a mixture.
// @ownership Snapshots are shared; the store keeps the current one alive.
#pragma once

#include "keyview/config/config.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace keyview::config
{

using Snapshot = std::shared_ptr<const Configuration>;

/// @brief Publishes configuration snapshots by whole-pointer swap.
class ConfigStore
{
  public:
    ConfigStore() = default;

    explicit ConfigStore(Snapshot initial);

    /// @brief Replace the current snapshot; null publishes an empty configuration.
    void publish(Snapshot next);

    /// @brief Current snapshot; never null.
    [[nodiscard]] Snapshot snapshot() const;

    /// @brief Number of successful publish() calls.
    [[nodiscard]] std::uint64_t generation() const;

  private:
    mutable std::mutex mutex_;
    Snapshot current_{std::make_shared<const Configuration>()};
    std::uint64_t generation_{0};
};

} // namespace keyview::config

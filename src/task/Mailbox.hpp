//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/Mailbox.hpp
// Purpose: Capacity-one handoff from background task threads to the UI thread.
// Key invariants:
//   - The slot holds zero or one message at any instant.
//   - offer() replaces an unread message instead of waiting (latest wins).
//   - The lock is held only while a message is moved in or out, so neither
//     operation can be stalled by process execution.
// Ownership/Lifetime: Messages are moved in by the writer and moved out by the
//                     reader; the slot is their sole owner in between.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace ite::task
{

/// @brief Formatted result travelling from a task thread to the poller.
struct OutputMessage
{
    std::uint64_t epoch = 0; ///< Sequence number of the request that produced it.
    std::string text;        ///< Display text produced by the result formatter.
};

/// @brief Single-slot, replace-with-latest mailbox.
/// @tparam T Message type; must be move-constructible.
template <typename T> class Mailbox
{
  public:
    Mailbox() = default;
    Mailbox(const Mailbox &) = delete;
    Mailbox &operator=(const Mailbox &) = delete;

    /// @brief Store @p message, discarding any unread one.
    /// @return True when an unread message was replaced.
    bool offer(T message)
    {
        std::optional<T> stale;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (slot_)
            {
                stale = std::move(slot_);
            }
            slot_.emplace(std::move(message));
        }
        // The superseded message is destroyed outside the lock.
        return stale.has_value();
    }

    /// @brief Take the pending message, leaving the slot empty.
    /// @return The message, or std::nullopt when nothing is available.
    std::optional<T> tryTake()
    {
        std::lock_guard<std::mutex> lock(mu_);
        std::optional<T> out = std::move(slot_);
        slot_.reset();
        return out;
    }

    /// @brief Whether the slot is currently empty.
    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return !slot_.has_value();
    }

  private:
    mutable std::mutex mu_;
    std::optional<T> slot_;
};

/// @brief Mailbox type connecting the task runner and the poller.
using OutputMailbox = Mailbox<OutputMessage>;

} // namespace ite::task

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace reclo {

/// Time source for chunk timestamps.
///
/// Wall time is unknown until the central side pushes it (time sync on
/// connect); until then chunks are stamped with monotonic seconds and
/// marked unsynced.
class Clock {
public:
    virtual ~Clock() = default;

    /// Unix epoch seconds, or nullopt if wall time is not yet known.
    virtual std::optional<uint32_t> wall_now() const = 0;

    /// Seconds since an arbitrary fixed point (boot).
    virtual uint32_t monotonic_now() const = 0;
};

/// Steady-clock backed implementation with a settable wall-time anchor.
class SystemClock : public Clock {
public:
    SystemClock();

    std::optional<uint32_t> wall_now() const override;
    uint32_t monotonic_now() const override;

    /// Anchor wall time to the current monotonic instant.
    void set_wall_time(uint32_t epoch_seconds);

    bool is_synced() const { return synced_.load(); }

private:
    using Steady = std::chrono::steady_clock;

    Steady::time_point  boot_;
    Steady::time_point  anchor_;
    uint32_t            epoch_base_ = 0;
    std::atomic<bool>   synced_{false};
    mutable std::mutex  mu_;
};

} // namespace reclo

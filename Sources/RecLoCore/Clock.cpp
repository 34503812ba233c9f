#include "Clock.hpp"

#include "Logging.hpp"

namespace reclo {

SystemClock::SystemClock() : boot_(Steady::now()), anchor_(boot_) {}

std::optional<uint32_t> SystemClock::wall_now() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!synced_.load()) return std::nullopt;

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        Steady::now() - anchor_);
    return epoch_base_ + static_cast<uint32_t>(elapsed.count());
}

uint32_t SystemClock::monotonic_now() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        Steady::now() - boot_);
    return static_cast<uint32_t>(elapsed.count());
}

void SystemClock::set_wall_time(uint32_t epoch_seconds) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        epoch_base_ = epoch_seconds;
        anchor_     = Steady::now();
        synced_.store(true);
    }
    log::get("recorder")->info("Time synced: epoch={}", epoch_seconds);
}

} // namespace reclo

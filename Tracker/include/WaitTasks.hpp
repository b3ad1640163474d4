#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

#include "TrackedTask.hpp"

// Debug/workaround helpers: hold a phase open for a while, as hidden
// progress so progress bars are unaffected.

// Ready after `cycles` cycles of its phase; reports {cycles seen - 1, cycles}.
class WaitCyclesTask : public TrackedTask {
public:
    explicit WaitCyclesTask(std::uint32_t cycles);

    void initialize() override;
    void tick(const TickContext& ctx, const ProgressCounter& counter) override;

    HiddenProgress step();

private:
    std::uint32_t cycles_;
    std::uint32_t count_ = 0;
};

// Ready once `millis` of wall-clock time passed since its first tick.
class WaitMillisTask : public TrackedTask {
public:
    using Clock = std::chrono::steady_clock;

    explicit WaitMillisTask(std::chrono::milliseconds millis);

    void initialize() override;
    void tick(const TickContext& ctx, const ProgressCounter& counter) override;

    HiddenProgress step(Clock::time_point now);

private:
    std::chrono::milliseconds millis_;
    std::optional<Clock::time_point> deadline_;
};

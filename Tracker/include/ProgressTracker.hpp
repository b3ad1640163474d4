#pragma once
#include <memory>
#include <stdexcept>
#include <string>

#include "PhaseMachine.hpp"
#include "Progress.hpp"
#include "ProgressConfig.hpp"
#include "ProgressCounter.hpp"
#include "TickContext.hpp"

// Thrown when the counter is used while its phase is not active. This means
// a task was scheduled outside the phase it belongs to.
class MissingCounterError : public std::runtime_error {
public:
    explicit MissingCounterError(const std::string& phase)
        : std::runtime_error("ProgressCounter for phase '" + phase +
                             "' does not exist (phase is not active)") {}
};

// Owns the ProgressCounter of one phase for exactly as long as that phase is
// active, resets it at the start of every cycle and decides when the phase is
// complete.
//
// Registers enter/exit callbacks on `machine` that capture `this`; the tracker
// must outlive every transition of that machine. A tracker created while its
// phase is already current starts out active.
class ProgressTracker {
public:
    ProgressTracker(ProgressConfig config, PhaseMachine& machine);
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    // phase lifecycle (normally driven by the machine's callbacks)
    void onPhaseEnter();
    void onPhaseExit();
    bool isActive() const { return counter_ != nullptr; }

    // Start of cycle: running totals back to the persisted baseline.
    // Must run before any task of the cycle records. No-op while inactive.
    void beginCycle();

    // Live counter; throws MissingCounterError while inactive.
    ProgressCounter& counter();
    const ProgressCounter& counter() const;

    // Exclusive access only: not while tasks are recording.
    void persist(const Progress& progress);
    void persistHidden(const HiddenProgress& progress);

    // Run after every task of the cycle has reported. Returns readiness of
    // the complete snapshot and, when ready and a next phase is configured,
    // requests the transition. Repeated calls in the same cycle return the
    // first result and do not request again.
    bool checkProgress(const TickContext& ctx);

    // Snapshot the last checkProgress decided on.
    const Progress& lastComplete() const { return last_complete_; }

    const ProgressConfig& config() const { return config_; }

private:
    void logRow_(const TickContext& ctx, const Progress& local,
                 bool ready, bool requested);

    ProgressConfig config_;
    PhaseMachine&  machine_;

    std::unique_ptr<ProgressCounter> counter_;

    int      checked_tick_ = -1;
    bool     last_ready_   = false;
    Progress last_complete_{};
};

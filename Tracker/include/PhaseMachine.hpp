#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "PhaseId.hpp"
#include "TickContext.hpp"

// Minimal host phase machine: tracks the current phase, fires enter/exit
// callbacks, and applies queued transition requests at the cycle boundary.
class PhaseMachine {
public:
    using Callback = std::function<void()>;

    void onEnter(const PhaseId& phase, Callback cb);
    void onExit(const PhaseId& phase, Callback cb);

    // Enter the initial phase (fires its enter callbacks).
    void start(const PhaseId& initial);

    // Queue a move to `next`; applied by applyPendingTransition. Last wins.
    void requestTransition(const PhaseId& next);

    // Apply the queued request, if any. Returns true if the phase changed.
    bool applyPendingTransition(const TickContext& ctx);

    // External override: leave the current phase now, drop any queued request.
    void forceTransition(const PhaseId& next, const TickContext& ctx);

    // CSV row per transition in PhaseMachine.csv (on by default).
    void setRowLogging(bool on) { log_rows_ = on; }

    const PhaseId& current() const { return current_; }
    bool started() const { return started_; }
    const std::optional<PhaseId>& pending() const { return pending_; }
    int transitionCount() const { return transitions_; }

private:
    struct Hook {
        PhaseId  phase;
        Callback cb;
    };

    void fire_(const std::vector<Hook>& hooks, const PhaseId& phase);
    void transition_(const PhaseId& next, const TickContext& ctx, bool forced);

    std::vector<Hook> enter_hooks_;
    std::vector<Hook> exit_hooks_;

    PhaseId current_;
    bool    started_ = false;
    std::optional<PhaseId> pending_;
    int     transitions_ = 0;
    bool    log_rows_ = true;
};

#include "PhaseMachine.hpp"
#include "Logger.hpp"

#include <stdexcept>

void PhaseMachine::onEnter(const PhaseId& phase, Callback cb) {
    enter_hooks_.push_back(Hook{ phase, std::move(cb) });
}

void PhaseMachine::onExit(const PhaseId& phase, Callback cb) {
    exit_hooks_.push_back(Hook{ phase, std::move(cb) });
}

void PhaseMachine::start(const PhaseId& initial) {
    if (started_) {
        throw std::logic_error("PhaseMachine: already started in phase " + current_);
    }
    started_ = true;
    current_ = initial;
    fire_(enter_hooks_, current_);
}

void PhaseMachine::requestTransition(const PhaseId& next) {
    pending_ = next;
}

bool PhaseMachine::applyPendingTransition(const TickContext& ctx) {
    if (!pending_) return false;

    PhaseId next = *pending_;
    pending_.reset();
    transition_(next, ctx, /*forced=*/false);
    return true;
}

void PhaseMachine::forceTransition(const PhaseId& next, const TickContext& ctx) {
    pending_.reset();
    transition_(next, ctx, /*forced=*/true);
}

void PhaseMachine::fire_(const std::vector<Hook>& hooks, const PhaseId& phase) {
    for (const auto& h : hooks) {
        if (h.phase == phase && h.cb) h.cb();
    }
}

void PhaseMachine::transition_(const PhaseId& next, const TickContext& ctx, bool forced) {
    if (!started_) {
        throw std::logic_error("PhaseMachine: transition to " + next + " before start()");
    }

    // exit first, so the old phase's state is gone before the new one appears
    fire_(exit_hooks_, current_);
    current_ = next;
    ++transitions_;
    fire_(enter_hooks_, current_);

    if (!log_rows_) return;
    Logger::instance().log_wide(
        "PhaseMachine",
        ctx.tick_index,
        ctx.time,
        {"transition", "forced", "count"},
        {1.0, forced ? 1.0 : 0.0, static_cast<double>(transitions_)}
    );
}

#include "ProgressTracker.hpp"
#include "DistributedProgress.hpp"
#include "Logger.hpp"

ProgressTracker::ProgressTracker(ProgressConfig config, PhaseMachine& machine)
    : config_(std::move(config)),
      machine_(machine)
{
    machine_.onEnter(config_.phase, [this]() { onPhaseEnter(); });
    machine_.onExit(config_.phase,  [this]() { onPhaseExit(); });

    // built after its phase was entered: the enter hook already fired
    if (machine_.started() && machine_.current() == config_.phase) {
        onPhaseEnter();
    }
}

void ProgressTracker::onPhaseEnter() {
    counter_ = std::make_unique<ProgressCounter>();
    checked_tick_  = -1;
    last_ready_    = false;
    last_complete_ = Progress{};
}

void ProgressTracker::onPhaseExit() {
    counter_.reset();
}

void ProgressTracker::beginCycle() {
    if (!counter_) return;
    counter_->resetToBaseline();
}

ProgressCounter& ProgressTracker::counter() {
    if (!counter_) throw MissingCounterError(config_.phase);
    return *counter_;
}

const ProgressCounter& ProgressTracker::counter() const {
    if (!counter_) throw MissingCounterError(config_.phase);
    return *counter_;
}

void ProgressTracker::persist(const Progress& progress) {
    counter().persist(progress);
}

void ProgressTracker::persistHidden(const HiddenProgress& progress) {
    counter().persistHidden(progress);
}

bool ProgressTracker::checkProgress(const TickContext& ctx) {
    const ProgressCounter& c = counter();

    if (ctx.tick_index == checked_tick_) {
        return last_ready_;
    }
    checked_tick_ = ctx.tick_index;

    const Progress local = c.readComplete();
    Progress complete = local;
    if (config_.distributed) {
        complete = allreduceProgress(local, config_.comm);
    }

    last_complete_ = complete;
    last_ready_    = complete.isReady();

    bool requested = false;
    if (last_ready_ && config_.next_phase) {
        machine_.requestTransition(*config_.next_phase);
        requested = true;
    }

    if (config_.log_rows) {
        logRow_(ctx, local, last_ready_, requested);
    }
    return last_ready_;
}

// Rows carry this rank's own counters; the decision may have used the sum.
void ProgressTracker::logRow_(const TickContext& ctx, const Progress& local,
                              bool ready, bool requested) {
    const Progress visible = counter().readVisible();
    const Progress hidden{ local.done - visible.done,
                           local.total - visible.total };

    Logger::instance().log_wide(
        config_.phase + "_progress",
        ctx.tick_index,
        ctx.time,
        {"done","total","hidden_done","hidden_total","ready","transition_requested"},
        {
            static_cast<double>(visible.done),
            static_cast<double>(visible.total),
            static_cast<double>(hidden.done),
            static_cast<double>(hidden.total),
            ready ? 1.0 : 0.0,
            requested ? 1.0 : 0.0
        }
    );
}

#include "ProgressLoop.hpp"

#include <stdexcept>

ProgressLoop::ProgressLoop(PhaseMachine& machine)
    : machine_(machine) {}

ProgressLoop::PhaseStage& ProgressLoop::stage_(const PhaseId& phase) {
    PhaseStage& st = stages_[phase];
    if (!st.engine) st.engine = std::make_unique<TickPhaseEngine>();
    return st;
}

void ProgressLoop::addTracker(ProgressTracker& tracker) {
    if (initialized_) {
        throw std::logic_error("ProgressLoop: addTracker after initialize()");
    }
    PhaseStage& st = stage_(tracker.config().phase);
    if (st.tracker && st.tracker != &tracker) {
        throw std::logic_error("ProgressLoop: phase '" + tracker.config().phase +
                               "' already has a tracker");
    }
    st.tracker = &tracker;
}

void ProgressLoop::addTask(const PhaseId& phase, TrackedTask* task) {
    if (initialized_) {
        throw std::logic_error("ProgressLoop: addTask after initialize()");
    }
    PhaseStage& st = stage_(phase);
    st.tasks.push_back(task);
    st.engine->addTask(task);
}

void ProgressLoop::addExclusiveTask(const PhaseId& phase, ExclusiveTask* task,
                                    ExclusiveStage stage) {
    if (initialized_) {
        throw std::logic_error("ProgressLoop: addExclusiveTask after initialize()");
    }
    PhaseStage& st = stage_(phase);
    if (stage == ExclusiveStage::Preparation) st.preparation.push_back(task);
    else                                      st.check.push_back(task);
}

void ProgressLoop::initialize() {
    for (auto& kv : stages_) {
        if (!kv.second.tracker) {
            throw std::logic_error("ProgressLoop: tasks registered for phase '" +
                                   kv.first + "' but no tracker");
        }
        for (auto* t : kv.second.tasks) t->initialize();
        kv.second.engine->start();
    }
    initialized_ = true;
}

void ProgressLoop::tick() {
    if (!initialized_) {
        throw std::logic_error("ProgressLoop: tick() before initialize()");
    }
    if (!machine_.started()) {
        throw std::logic_error("ProgressLoop: phase machine not started");
    }

    const TickContext ctx = nextContext();

    auto it = stages_.find(machine_.current());
    if (it != stages_.end()) {
        PhaseStage& st = it->second;
        if (!st.tracker) {
            throw std::logic_error("ProgressLoop: phase '" + it->first +
                                   "' has tasks but no tracker");
        }
        ProgressTracker& tracker = *st.tracker;

        // current phase is tracked, so its counter must exist
        if (!tracker.isActive()) throw MissingCounterError(it->first);

        tracker.beginCycle();
        for (auto* x : st.preparation) x->run(ctx, tracker);

        st.engine->runTick(ctx, tracker.counter());

        for (auto* x : st.check) x->run(ctx, tracker);
        tracker.checkProgress(ctx);
    }

    machine_.applyPendingTransition(ctx);

    tick_count_ += 1;
    sim_time_   += tick_step_;
}

void ProgressLoop::setTickStep(double dt) {
    if (dt <= 0.0) {
        throw std::invalid_argument("ProgressLoop: tick step must be > 0");
    }
    tick_step_ = dt;
}

TickContext ProgressLoop::nextContext() const {
    return TickContext{ tick_count_, sim_time_, tick_step_ };
}

void ProgressLoop::shutdown() {
    for (auto& kv : stages_) {
        kv.second.engine->stop();
        for (auto* t : kv.second.tasks) t->shutdown();
    }
    initialized_ = false;
}

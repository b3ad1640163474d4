#pragma once
#include <map>
#include <memory>
#include <vector>

#include "PhaseMachine.hpp"
#include "ProgressTracker.hpp"
#include "TickPhaseEngine.hpp"
#include "TrackedTask.hpp"

// Where an exclusive task runs relative to the phase's tracked tasks.
enum class ExclusiveStage {
    Preparation,   // after the cycle reset, before tracked tasks
    CheckProgress  // after tracked tasks, before the transition decision
};

// Cycle driver. For the current phase, each tick():
//   1) tracker.beginCycle()           reset to persisted baseline
//   2) Preparation exclusive tasks
//   3) tracked tasks, in parallel     fenced by TickPhaseEngine::runTick
//   4) CheckProgress exclusive tasks
//   5) tracker.checkProgress()        may request the next phase
// and finally applies any pending transition.
class ProgressLoop {
public:
    explicit ProgressLoop(PhaseMachine& machine);

    void addTracker(ProgressTracker& tracker);
    void addTask(const PhaseId& phase, TrackedTask* task);
    void addExclusiveTask(const PhaseId& phase, ExclusiveTask* task,
                          ExclusiveStage stage = ExclusiveStage::Preparation);

    void initialize();
    void tick();
    void setTickStep(double dt);
    void shutdown();

    // Context the next tick() will run with.
    TickContext nextContext() const;
    int tickCount() const { return tick_count_; }

private:
    struct PhaseStage {
        ProgressTracker* tracker = nullptr;
        std::unique_ptr<TickPhaseEngine> engine;
        std::vector<TrackedTask*>   tasks;
        std::vector<ExclusiveTask*> preparation;
        std::vector<ExclusiveTask*> check;
    };

    PhaseStage& stage_(const PhaseId& phase);

    PhaseMachine& machine_;
    std::map<PhaseId, PhaseStage> stages_;
    bool initialized_ = false;

    int    tick_count_ = 1;
    double sim_time_   = 0.0;
    double tick_step_  = 1.0 / 60.0;   // seconds per cycle
};

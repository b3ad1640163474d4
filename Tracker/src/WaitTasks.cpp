#include "WaitTasks.hpp"
#include "ApplyProgress.hpp"

WaitCyclesTask::WaitCyclesTask(std::uint32_t cycles)
    : TrackedTask("WaitCycles"),
      cycles_(cycles) {}

void WaitCyclesTask::initialize() {
    count_ = 0;
}

HiddenProgress WaitCyclesTask::step() {
    if (count_ <= cycles_) {
        ++count_;
    }
    return HiddenProgress{ Progress{ count_ - 1, cycles_ } };
}

void WaitCyclesTask::tick(const TickContext&, const ProgressCounter& counter) {
    applyProgress(step(), counter);
}

WaitMillisTask::WaitMillisTask(std::chrono::milliseconds millis)
    : TrackedTask("WaitMillis"),
      millis_(millis) {}

void WaitMillisTask::initialize() {
    deadline_.reset();
}

HiddenProgress WaitMillisTask::step(Clock::time_point now) {
    if (!deadline_) {
        deadline_ = now + millis_;
    }
    return HiddenProgress::from(now > *deadline_);
}

void WaitMillisTask::tick(const TickContext&, const ProgressCounter& counter) {
    applyProgress(step(Clock::now()), counter);
}

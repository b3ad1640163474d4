#pragma once
#include <string>

#include "ProgressCounter.hpp"
#include "TickContext.hpp"

class ProgressTracker;

// Task scheduled once per cycle while its phase is active. Runs on its own
// worker thread in parallel with the phase's other tasks, so it only gets
// shared (record-only) access to the counter.
class TrackedTask {
public:
    explicit TrackedTask(const std::string& name) : name_(name) {}
    virtual ~TrackedTask() = default;

    // lifecycle
    virtual void initialize() {}
    virtual void tick(const TickContext& ctx, const ProgressCounter& counter) = 0;
    virtual void shutdown() {}

    // access
    std::string getName() const { return name_; }

protected:
    std::string name_;
};

// Task run on the loop thread at a cycle boundary, with exclusive access to
// the tracker (it may persist progress).
class ExclusiveTask {
public:
    explicit ExclusiveTask(const std::string& name) : name_(name) {}
    virtual ~ExclusiveTask() = default;

    virtual void run(const TickContext& ctx, ProgressTracker& tracker) = 0;

    std::string getName() const { return name_; }

protected:
    std::string name_;
};

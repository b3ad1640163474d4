#pragma once
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <exception>

#include "ProgressCounter.hpp"
#include "TrackedTask.hpp"
#include "TickContext.hpp"

// Runs the tracked tasks of one phase, one worker thread per task.
//
// runTick returns only after every task has finished its tick; the
// release/acquire pair on doneCount_ makes all of their record() calls
// visible to the caller before it reads the counter.
class TickPhaseEngine {
public:
    TickPhaseEngine();
    ~TickPhaseEngine();

    void addTask(TrackedTask* t);
    void start();
    void stop();

    // Rethrows the first exception a task threw during this tick.
    void runTick(const TickContext& ctx, const ProgressCounter& counter);

    bool running() const { return running_; }
    std::size_t size() const { return tasks_.size(); }

private:
    std::vector<TrackedTask*> tasks_;
    std::vector<std::thread> threads_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};

    TickContext currentCtx_;
    const ProgressCounter* currentCounter_ = nullptr;
    std::atomic<int> tickIndex_{0};
    std::atomic<std::size_t> doneCount_{0};

    std::mutex errMtx_;
    std::exception_ptr firstError_;
};

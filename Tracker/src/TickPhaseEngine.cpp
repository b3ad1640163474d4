#include "TickPhaseEngine.hpp"

#include <stdexcept>

TickPhaseEngine::TickPhaseEngine()
    : running_(false),
      tickIndex_(-1),
      doneCount_(0) {}


TickPhaseEngine::~TickPhaseEngine() {
    stop();
}


void TickPhaseEngine::start() {
    if (running_) return;
    running_ = true;
    for (auto* t : tasks_) {
        threads_.emplace_back([this, t]() {
            int seen = -1;
            while (true) {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&]() {
                    return !running_ || tickIndex_ > seen;
                });

                if (!running_) break;

                seen = tickIndex_;
                TickContext ctx = currentCtx_;
                const ProgressCounter* counter = currentCounter_;
                lock.unlock();

                try {
                    t->tick(ctx, *counter);
                } catch (...) {
                    std::lock_guard<std::mutex> elock(errMtx_);
                    if (!firstError_) firstError_ = std::current_exception();
                }
                doneCount_.fetch_add(1, std::memory_order_release);
            }
        });
    }
}


void TickPhaseEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& th : threads_) {
        if (th.joinable()) th.join();
    }
    threads_.clear();
}

void TickPhaseEngine::addTask(TrackedTask* t) {
    if (running_) {
        throw std::logic_error("TickPhaseEngine: addTask after start()");
    }
    tasks_.push_back(t);
    // Worker threads will be spawned in start()
}

void TickPhaseEngine::runTick(const TickContext& ctx, const ProgressCounter& counter) {
    if (!running_) {
        throw std::logic_error("TickPhaseEngine: runTick before start()");
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (ctx.tick_index <= tickIndex_) {
            throw std::logic_error("TickPhaseEngine: tick index must increase");
        }
        tickIndex_      = ctx.tick_index;
        currentCtx_     = ctx;
        currentCounter_ = &counter;
        doneCount_      = 0;
    }

    cv_.notify_all();

    while (doneCount_.load(std::memory_order_acquire) < tasks_.size()) {
        std::this_thread::yield();
    }

    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> elock(errMtx_);
        err = firstError_;
        firstError_ = nullptr;
    }
    if (err) std::rethrow_exception(err);
}

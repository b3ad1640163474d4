#include "ProgressCounter.hpp"

#include <algorithm>

void ProgressCounter::record(const Progress& progress) const {
    total_.fetch_add(progress.total, std::memory_order_release);
    // clamp in case a task reports done > total
    done_.fetch_add(std::min(progress.done, progress.total),
                    std::memory_order_release);
}

void ProgressCounter::recordHidden(const HiddenProgress& progress) const {
    total_hidden_.fetch_add(progress.value.total, std::memory_order_release);
    done_hidden_.fetch_add(std::min(progress.value.done, progress.value.total),
                           std::memory_order_release);
}

Progress ProgressCounter::readVisible() const {
    Progress p;
    p.total = total_.load(std::memory_order_acquire);
    p.done  = done_.load(std::memory_order_acquire);
    return p;
}

Progress ProgressCounter::readComplete() const {
    Progress hidden;
    hidden.total = total_hidden_.load(std::memory_order_acquire);
    hidden.done  = done_hidden_.load(std::memory_order_acquire);
    return readVisible() + hidden;
}

void ProgressCounter::persist(const Progress& progress) {
    record(progress);
    persisted_ += progress;
}

void ProgressCounter::persistHidden(const HiddenProgress& progress) {
    recordHidden(progress);
    persisted_hidden_ += progress.value;
}

void ProgressCounter::resetToBaseline() {
    done_.store(persisted_.done, std::memory_order_release);
    total_.store(persisted_.total, std::memory_order_release);
    done_hidden_.store(persisted_hidden_.done, std::memory_order_release);
    total_hidden_.store(persisted_hidden_.total, std::memory_order_release);
}

#pragma once
#include <atomic>
#include <cstdint>

#include "Progress.hpp"

// Combined progress of every task in the active phase for the current cycle.
//
// Recording goes through const member functions backed by atomics, so tasks
// running on different worker threads share a `const ProgressCounter&` and
// never take a lock. Persisting and the cycle reset rewrite the baseline and
// need the non-const (exclusive) reference; they must not overlap with
// recording.
//
// Reads are only meaningful once every task of the cycle has reported.
class ProgressCounter {
public:
    ProgressCounter() = default;
    ProgressCounter(const ProgressCounter&) = delete;
    ProgressCounter& operator=(const ProgressCounter&) = delete;

    // Add to the visible running totals. done is clamped to total per call.
    void record(const Progress& progress) const;

    // Add to the hidden running totals. done is clamped to total per call.
    void recordHidden(const HiddenProgress& progress) const;

    // Visible progress only; use for progress bars.
    Progress readVisible() const;

    // Visible + hidden; use for anything that gates completion.
    Progress readComplete() const;

    // Count `progress` this cycle and in every later cycle of the phase.
    void persist(const Progress& progress);
    void persistHidden(const HiddenProgress& progress);

    // Start of a new cycle: running totals go back to the persisted baseline.
    void resetToBaseline();

    const Progress& persisted() const { return persisted_; }
    const Progress& persistedHidden() const { return persisted_hidden_; }

private:
    mutable std::atomic<std::uint32_t> done_{0};
    mutable std::atomic<std::uint32_t> total_{0};
    mutable std::atomic<std::uint32_t> done_hidden_{0};
    mutable std::atomic<std::uint32_t> total_hidden_{0};

    Progress persisted_{};
    Progress persisted_hidden_{};
};

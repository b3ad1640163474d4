#pragma once
#include <cstdint>

// Progress reported by a task: `done` of `total` units of work.
//
// A task is "ready" once done >= total; the phase completes when the sum of
// all contributions is ready. `done > total` is tolerated here and clamped
// by ProgressCounter when the value is recorded.
struct Progress {
    std::uint32_t done  = 0;
    std::uint32_t total = 0;

    // true -> {1,1}, false -> {0,1}, for pass/fail style tasks
    static Progress from(bool ready);

    bool isReady() const { return done >= total; }

    // done / total for progress bars. Not guarded: check total > 0 first.
    float  toFloat() const;
    double toDouble() const;

    Progress& operator+=(const Progress& rhs);
};

Progress operator+(Progress lhs, const Progress& rhs);
bool operator==(const Progress& a, const Progress& b);
bool operator!=(const Progress& a, const Progress& b);

// Progress that gates completion but is kept out of user-facing totals
// (ProgressCounter::readVisible ignores it, readComplete includes it).
struct HiddenProgress {
    Progress value;

    static HiddenProgress from(bool ready);

    bool isReady() const { return value.isReady(); }

    HiddenProgress& operator+=(const HiddenProgress& rhs);
};

HiddenProgress operator+(HiddenProgress lhs, const HiddenProgress& rhs);

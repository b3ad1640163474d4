#pragma once
#include <utility>

#include "Progress.hpp"
#include "ProgressCounter.hpp"

// The contribution kinds a task may hand back: visible Progress,
// HiddenProgress, or a pair of those applied element by element.

inline void applyProgress(const Progress& p, const ProgressCounter& counter) {
    counter.record(p);
}

inline void applyProgress(const HiddenProgress& p, const ProgressCounter& counter) {
    counter.recordHidden(p);
}

template <typename A, typename B>
void applyProgress(const std::pair<A, B>& p, const ProgressCounter& counter) {
    applyProgress(p.first, counter);
    applyProgress(p.second, counter);
}

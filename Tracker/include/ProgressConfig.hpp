#pragma once
#include <optional>
#include <string>
#include <utility>
#include <mpi.h>

#include "PhaseId.hpp"

// Setup for one ProgressTracker.
//
//   auto cfg = ProgressConfig::forPhase("Loading").continueTo("InGame");
//
// Without next_phase, readiness is still observable through
// ProgressTracker::checkProgress but no transition is requested.
struct ProgressConfig {
    PhaseId                phase;
    std::optional<PhaseId> next_phase;

    // Write one CSV row per checked cycle to "<phase>_progress.csv".
    bool log_rows = true;

    // Sum the complete snapshot over `comm` before deciding, so every rank
    // takes the same transition. checkProgress becomes a collective call.
    bool     distributed = false;
    MPI_Comm comm        = MPI_COMM_WORLD;

    static ProgressConfig forPhase(PhaseId phase) {
        ProgressConfig c;
        c.phase = std::move(phase);
        return c;
    }

    ProgressConfig& continueTo(PhaseId next) {
        next_phase = std::move(next);
        return *this;
    }

    ProgressConfig& withRowLogging(bool on) {
        log_rows = on;
        return *this;
    }

    ProgressConfig& distributedOver(MPI_Comm c) {
        distributed = true;
        comm        = c;
        return *this;
    }
};

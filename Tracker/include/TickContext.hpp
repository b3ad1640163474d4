#pragma once

// Snapshot of one scheduler cycle, handed to every task that runs in it.
struct TickContext {
    int    tick_index = 0;     // cycle number, strictly increasing
    double time       = 0.0;   // simulated time at the start of the cycle (s)
    double dt         = 0.0;   // seconds per cycle
};

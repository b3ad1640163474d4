#pragma once

#include <string>
#include <functional>

namespace TrackerHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  int    cycles      = 600;      // hard stop if the phase never completes
  int    assets      = 48;       // units the loader has to bring in
  int    batch       = 4;        // units loaded per cycle
  int    waitCycles  = 30;       // hidden warm-up, in cycles
  int    waitMillis  = 250;      // hidden minimum screen time, in ms
  double dt          = 1.0 / 60.0;
  bool   distributed = false;    // reduce progress over MPI_COMM_WORLD
  bool   showHelp    = false;
};

// Logger function type used by the demo (stderr + debug file on rank 0).
using LogFn = std::function<void(const std::string&)>;

// Argument helpers
Args parse_args(int argc, char** argv);
void print_usage();

// Clamp nonsensical values back to defaults, reporting each through log_fn.
void sanitize_args(Args& a, LogFn log_fn);

// "[#####.....]  42.0%  (21/50)" for a visible snapshot; empty totals
// render as "[..........]   --   (0/0)".
std::string render_bar(unsigned int done, unsigned int total, int width = 20);

} // namespace TrackerHelpers

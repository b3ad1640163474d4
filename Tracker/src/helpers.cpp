#include "helpers.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>

#include "Progress.hpp"

namespace TrackerHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--cycles") && i + 1 < argc)           a.cycles = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--assets") && i + 1 < argc)      a.assets = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--batch") && i + 1 < argc)       a.batch = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--wait-cycles") && i + 1 < argc) a.waitCycles = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--wait-ms") && i + 1 < argc)     a.waitMillis = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--dt") && i + 1 < argc)          a.dt = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--distributed"))                 a.distributed = true;
    else if (arg_eq(argv[i], "--help"))                        a.showHelp = true;
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: progress_demo [--cycles N] [--assets N] [--batch N]\n"
    "                     [--wait-cycles N] [--wait-ms MS] [--dt seconds]\n"
    "                     [--distributed]\n"
    "\n"
    "Runs Splash -> Loading -> InGame. Loading completes once every asset is\n"
    "loaded and both hidden waits have elapsed. With --distributed (under\n"
    "mpirun) the Loading decision uses the sum over all ranks.\n"
    "\n"
    "Env: PT_LOG_DIR overrides the CSV directory, RUN_ID adds a subfolder.\n";
}

void sanitize_args(Args& a, LogFn log_fn) {
  auto warn = [&](const std::string& s) { if (log_fn) log_fn("[warn] " + s + "\n"); };

  if (a.cycles <= 0) {
    warn("cycles <= 0; defaulting to 600.");
    a.cycles = 600;
  }
  if (a.assets < 0) {
    warn("assets < 0; defaulting to 48.");
    a.assets = 48;
  }
  if (a.batch <= 0) {
    warn("batch <= 0; defaulting to 4.");
    a.batch = 4;
  }
  if (a.waitCycles < 0) {
    warn("wait-cycles < 0; defaulting to 0.");
    a.waitCycles = 0;
  }
  if (a.waitMillis < 0) {
    warn("wait-ms < 0; defaulting to 0.");
    a.waitMillis = 0;
  }
  if (!(a.dt > 0.0)) {
    warn("dt <= 0; defaulting to 1/60 s.");
    a.dt = 1.0 / 60.0;
  }
}

std::string render_bar(unsigned int done, unsigned int total, int width) {
  std::ostringstream oss;
  if (width < 1) width = 1;

  if (total == 0) {
    oss << '[' << std::string(width, '.') << "]   --   (0/0)";
    return oss.str();
  }

  Progress p{ done, total };
  double frac = std::clamp(p.toDouble(), 0.0, 1.0);
  int filled  = static_cast<int>(frac * width + 0.5);

  oss << '[' << std::string(filled, '#') << std::string(width - filled, '.') << "] "
      << std::setw(5) << std::fixed << std::setprecision(1) << frac * 100.0 << "%  ("
      << done << '/' << total << ')';
  return oss.str();
}

} // namespace TrackerHelpers

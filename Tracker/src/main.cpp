// Tracker/src/main.cpp
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run:
  ./build/progress_demo                                  // single process
  ./build/progress_demo --assets 120 --batch 3 --wait-ms 500
  mpirun -np 4 ./build/progress_demo --distributed       // global decision

  Rank 0 writes data/raw/<RUN_ID>/Loading_progress.csv and PhaseMachine.csv,
  and mirrors console output to progress_debug_<RUN_ID>.log.
*/

#include <mpi.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "ApplyProgress.hpp"
#include "PhaseMachine.hpp"
#include "ProgressLoop.hpp"
#include "ProgressTracker.hpp"
#include "WaitTasks.hpp"
#include "helpers.hpp"

using TrackerHelpers::Args;
using TrackerHelpers::LogFn;
using TrackerHelpers::parse_args;
using TrackerHelpers::print_usage;
using TrackerHelpers::render_bar;
using TrackerHelpers::sanitize_args;

namespace {

const PhaseId kSplash  = "Splash";
const PhaseId kLoading = "Loading";
const PhaseId kInGame  = "InGame";

// ---------------------------------------------------------------------------
// Loads `assets` units, `batch` per cycle. Only the units the persister has
// not yet baked into the baseline are reported, so nothing is counted twice.
// ---------------------------------------------------------------------------
class AssetBatchLoader : public TrackedTask {
public:
    AssetBatchLoader(std::uint32_t assets, std::uint32_t batch)
        : TrackedTask("AssetBatchLoader"), assets_(assets), batch_(batch) {}

    void initialize() override {
        loaded_    = 0;
        persisted_ = 0;
    }

    void tick(const TickContext&, const ProgressCounter& counter) override {
        std::uint32_t loaded = loaded_.load();
        if (loaded < assets_) {
            loaded = std::min(assets_, loaded + batch_);
            loaded_.store(loaded);
        }
        const std::uint32_t p = persisted_.load();
        applyProgress(Progress{ loaded - p, assets_ - p }, counter);
    }

    std::uint32_t loaded() const { return loaded_.load(); }
    std::uint32_t persisted() const { return persisted_.load(); }
    void markPersisted(std::uint32_t n) { persisted_ += n; }

private:
    std::uint32_t assets_;
    std::uint32_t batch_;
    std::atomic<std::uint32_t> loaded_{0};
    std::atomic<std::uint32_t> persisted_{0};
};

// Persists every asset the loader has finished, once, at the start of a cycle.
class AssetPersister : public ExclusiveTask {
public:
    explicit AssetPersister(AssetBatchLoader& loader)
        : ExclusiveTask("AssetPersister"), loader_(loader) {}

    void run(const TickContext&, ProgressTracker& tracker) override {
        const std::uint32_t fresh = loader_.loaded() - loader_.persisted();
        if (fresh == 0) return;
        tracker.persist(Progress{ fresh, fresh });
        loader_.markPersisted(fresh);
    }

private:
    AssetBatchLoader& loader_;
};

// Splash is a pass/fail phase: ready after its first cycle.
class SplashShown : public TrackedTask {
public:
    SplashShown() : TrackedTask("SplashShown") {}

    void tick(const TickContext& ctx, const ProgressCounter& counter) override {
        if (first_ < 0) first_ = ctx.tick_index;
        applyProgress(Progress::from(ctx.tick_index > first_), counter);
    }

private:
    int first_ = -1;
};

} // anonymous namespace

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);

  int rank = 0, size = 1;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  Args args = parse_args(argc, argv);

  // ------------------------------------------------------------------------
  // Debug logger: mirrors messages to stderr and a per-run file on rank 0.
  // ------------------------------------------------------------------------
  std::ofstream debugLog;
  LogFn log_msg = [&](const std::string& s) {
    if (rank == 0) {
      std::cerr << s;
      if (debugLog.is_open()) {
        debugLog << s;
        debugLog.flush();
      }
    }
  };

  if (rank == 0) {
    const char* env_run_id = std::getenv("RUN_ID");
    std::string run_id     = env_run_id ? env_run_id : "norunid";

    std::string filename = "progress_debug_" + run_id + ".log";
    debugLog.open(filename, std::ios::out | std::ios::app);
    if (!debugLog) {
      std::cerr << "[warn] Failed to open " << filename << " for writing.\n";
    } else {
      debugLog << "============================================================\n";
      debugLog << "New run started (RUN_ID=" << run_id
               << ", world_size=" << size << ")\n";
      debugLog << "============================================================\n";
      debugLog.flush();
    }
  }

  if (args.showHelp) {
    if (rank == 0) print_usage();
    MPI_Finalize();
    return 0;
  }

  sanitize_args(args, log_msg);

  try {
    if (rank == 0) {
      std::ostringstream oss;
      oss << "[info] MPI world size = " << size << "\n";
      oss << "[info] Args: cycles=" << args.cycles
          << " assets=" << args.assets
          << " batch=" << args.batch
          << " waitCycles=" << args.waitCycles
          << " waitMillis=" << args.waitMillis
          << " dt=" << args.dt
          << " distributed=" << (args.distributed ? 1 : 0) << "\n";

      const char* env_run_id  = std::getenv("RUN_ID");
      const char* env_log_dir = std::getenv("PT_LOG_DIR");
      oss << "[info] Env: RUN_ID="     << (env_run_id  ? env_run_id  : "<unset>") << "\n";
      oss << "[info] Env: PT_LOG_DIR=" << (env_log_dir ? env_log_dir : "<unset>") << "\n";
      log_msg(oss.str());
    }

    // --------------------------------------------------------------------
    // Phases and trackers
    // --------------------------------------------------------------------
    PhaseMachine machine;
    machine.setRowLogging(rank == 0);

    ProgressTracker splash(
        ProgressConfig::forPhase(kSplash).continueTo(kLoading).withRowLogging(rank == 0),
        machine);

    ProgressConfig loadingCfg =
        ProgressConfig::forPhase(kLoading).continueTo(kInGame).withRowLogging(rank == 0);
    if (args.distributed) loadingCfg.distributedOver(MPI_COMM_WORLD);
    ProgressTracker loading(loadingCfg, machine);

    // --------------------------------------------------------------------
    // Tasks
    // --------------------------------------------------------------------
    SplashShown      splashShown;
    AssetBatchLoader loader(static_cast<std::uint32_t>(args.assets),
                            static_cast<std::uint32_t>(args.batch));
    AssetPersister   persister(loader);
    WaitCyclesTask   warmup(static_cast<std::uint32_t>(args.waitCycles));
    WaitMillisTask   minScreen(std::chrono::milliseconds(args.waitMillis));

    ProgressLoop loop(machine);
    loop.addTracker(splash);
    loop.addTracker(loading);
    loop.addTask(kSplash, &splashShown);
    loop.addTask(kLoading, &loader);
    loop.addTask(kLoading, &warmup);
    loop.addTask(kLoading, &minScreen);
    loop.addExclusiveTask(kLoading, &persister, ExclusiveStage::Preparation);

    loop.setTickStep(args.dt);
    loop.initialize();
    machine.start(kSplash);

    if (rank == 0) {
      std::ostringstream oss;
      oss << "[info] Starting in phase " << machine.current() << "\n";
      log_msg(oss.str());
    }

    // --------------------------------------------------------------------
    // Main loop
    // --------------------------------------------------------------------
    int i = 0;
    for (; i < args.cycles && machine.current() != kInGame; ++i) {
      const PhaseId before = machine.current();
      loop.tick();

      if (rank == 0 && before == kLoading) {
        const Progress shown = loading.lastComplete();
        std::ostringstream oss;
        // the counter is gone once Loading exits; use what the decision saw
        if (loading.isActive()) {
          const Progress vis = loading.counter().readVisible();
          oss << "[load] cycle " << (i + 1) << " " << render_bar(vis.done, vis.total)
              << "  complete=" << shown.done << "/" << shown.total << "\n";
        } else {
          oss << "[load] cycle " << (i + 1) << " complete=" << shown.done << "/"
              << shown.total << " -> " << machine.current() << "\n";
        }
        log_msg(oss.str());
      }

      if (rank == 0 && before != machine.current()) {
        std::ostringstream oss;
        oss << "[info] Phase " << before << " -> " << machine.current()
            << " after cycle " << (i + 1) << "\n";
        log_msg(oss.str());
      }
    }

    loop.shutdown();

    if (machine.current() != kInGame) {
      std::ostringstream oss;
      oss << "[warn] Stopped after " << i << " cycle(s) still in phase "
          << machine.current() << "\n";
      log_msg(oss.str());
    } else if (rank == 0) {
      log_msg("[info] Reached InGame; shutting down.\n");
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return machine.current() == kInGame ? EXIT_SUCCESS : EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[fatal] std::exception on rank " << rank << ": " << e.what() << "\n";
    log_msg(oss.str());
    MPI_Abort(MPI_COMM_WORLD, 1);
    return EXIT_FAILURE;
  }
}

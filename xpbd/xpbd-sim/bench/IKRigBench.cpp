// Ticket: 0009_ik_rig_tick

#include <benchmark/benchmark.h>
#include <memory>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"
#include "xpbd-sim/src/Rig/IKRig.hpp"
#include "xpbd-sim/src/Rig/TrackingInput.hpp"
#include "xpbd-sim/src/Rig/TuningParameters.hpp"

using namespace xpbd_sim;

namespace
{

std::shared_ptr<spdlog::logger> quietLogger()
{
  return std::make_shared<spdlog::logger>(
    "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
}

TrackingFrame standing(double x)
{
  TrackingFrame tracking;
  tracking.hmd = ReferenceFrame{Coordinate{x, 1.6, 0.0}};
  tracking.leftGrip = ReferenceFrame{Coordinate{x - 0.25, 0.9, -0.1}};
  tracking.leftAim = tracking.leftGrip;
  tracking.rightGrip = ReferenceFrame{Coordinate{x + 0.25, 0.9, -0.1}};
  tracking.rightAim = tracking.rightGrip;
  return tracking;
}

}  // namespace

// ============================================================================
// Rig Tick Benchmarks
// ============================================================================

/**
 * @brief Full rig tick (resolve, locomotion, solve) with varying iterations
 *
 * The headset drifts sideways every tick so the locomotion controller
 * periodically steps and the solver never starts from a converged pose.
 */
static void BM_IKRig_Tick(benchmark::State& state)
{
  TuningParameters params;
  params.set("solver_iterations", static_cast<double>(state.range(0)));
  IKRig const rig{params, quietLogger()};
  RigState rigState;

  double x = 0.0;
  for (auto _ : state)
  {
    x += 0.002;
    auto result = rig.tick(rigState, standing(x));
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_IKRig_Tick)->Arg(1)->Arg(10)->Arg(40);

BENCHMARK_MAIN();

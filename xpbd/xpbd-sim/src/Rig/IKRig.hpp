// Ticket: 0009_ik_rig_tick

#ifndef XPBD_SIM_RIG_IK_RIG_HPP
#define XPBD_SIM_RIG_IK_RIG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <spdlog/logger.h>

#include "xpbd-sim/src/Physics/Constraints/ConstraintSet.hpp"
#include "xpbd-sim/src/Physics/Constraints/GaussSeidelSolver.hpp"
#include "xpbd-sim/src/Rig/DriverResolver.hpp"
#include "xpbd-sim/src/Rig/LocomotionController.hpp"
#include "xpbd-sim/src/Rig/PoseSink.hpp"
#include "xpbd-sim/src/Rig/TrackingInput.hpp"
#include "xpbd-sim/src/Rig/TuningParameters.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

namespace xpbd_sim
{

/**
 * @brief Everything one skeleton carries from one tick to the next
 *
 * The pose is the solver's warm start; the locomotion state holds the foot
 * targets and weight distribution.
 */
struct RigState
{
  SkeletonPose pose;
  LocomotionState locomotion;
  uint64_t tickCount{0};
};

/// @brief Diagnostics of one rig tick
struct TickResult
{
  LocomotionDecision locomotion;
  GaussSeidelSolver::SolveResult solve;
  size_t sinkFailures{0};          ///< Sink callbacks that threw
  bool snapshotRequested{false};   ///< Snapshot forwarded to the sink
};

/**
 * @brief Full-body IK: tracked head and hands in, 25 solved landmarks out
 *
 * Per tick:
 * 1. Resolve driver transforms from the tracking sample
 * 2. Advance the locomotion state machine (foot targets)
 * 3. Seed the 15 driven landmarks
 * 4. Gauss-Seidel solve of the humanoid constraint set, warm-started from the
 *    previous pose
 * 5. Write every landmark back through the PoseSink
 * 6. Forward a snapshot request when the menu button was just pressed
 *
 * Sink exceptions are caught per call, logged and counted; the solved state
 * is already committed by then.
 *
 * Thread safety: Not thread-safe. One IKRig may drive several RigStates
 * sequentially.
 */
class IKRig
{
public:
  static constexpr size_t kDrivenCount = 15;

  /**
   * @param params Body dimensions and solver tuning
   * @param logger Logger for tick diagnostics (spdlog default logger if null)
   * @throws std::invalid_argument if params yield an invalid constraint set
   */
  explicit IKRig(const TuningParameters& params,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Run one IK tick
   *
   * @param state Cross-tick rig state (pose and locomotion mutated in place)
   * @param tracking Tracking sample for this tick
   * @param sink Optional write-back target
   * @return Locomotion decision, solver diagnostics and sink failure count
   */
  TickResult tick(RigState& state,
                  const TrackingFrame& tracking,
                  PoseSink* sink = nullptr) const;

  /**
   * @brief Hot-reload tuning
   *
   * Rebuilds the constraint set and the locomotion and solver configuration.
   * Existing RigStates stay valid and warm-start from their current pose.
   */
  void setParameters(const TuningParameters& params);

  [[nodiscard]] const TuningParameters& getParameters() const
  {
    return params_;
  }

  [[nodiscard]] const ConstraintSet& getConstraints() const
  {
    return constraints_;
  }

  [[nodiscard]] std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

  /// @brief Landmarks re-seeded from drivers on every solver sweep
  [[nodiscard]] static std::span<const Landmark> drivenLandmarks();

  /// @brief Locomotion configuration derived from tuning parameters
  [[nodiscard]] static LocomotionController::Config locomotionConfig(
    const TuningParameters& params);

private:
  [[nodiscard]] static std::array<DrivenNode, kDrivenCount> drivenNodes(
    const DriverFrames& drivers,
    const LocomotionDecision& locomotion);

  size_t writeBack(const SkeletonPose& pose, PoseSink& sink) const;

  TuningParameters params_;
  ConstraintSet constraints_;
  LocomotionController locomotion_;
  GaussSeidelSolver solver_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_IK_RIG_HPP

// Ticket: 0007_driver_resolver

#ifndef XPBD_SIM_RIG_DRIVER_RESOLVER_HPP
#define XPBD_SIM_RIG_DRIVER_RESOLVER_HPP

#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"
#include "xpbd-sim/src/Rig/LocomotionController.hpp"
#include "xpbd-sim/src/Rig/TrackingInput.hpp"
#include "xpbd-sim/src/Rig/TuningParameters.hpp"

namespace xpbd_sim
{

/// @brief Stage-space transforms derived from one tracking sample
struct DriverFrames
{
  ReferenceFrame hmd;
  ReferenceFrame headCenter;
  ReferenceFrame neckRoot;
  ReferenceFrame base;
  ReferenceFrame leftGrip;
  ReferenceFrame leftAim;
  ReferenceFrame leftPalm;
  ReferenceFrame leftWrist;
  ReferenceFrame rightGrip;
  ReferenceFrame rightAim;
  ReferenceFrame rightPalm;
  ReferenceFrame rightWrist;
  ReferenceFrame leftFoot;   ///< Locomotion input (previous target or default)
  ReferenceFrame rightFoot;  ///< Locomotion input (previous target or default)
};

/**
 * @brief Derives the rig's driver transforms from raw tracking data
 *
 * Pure function of the tracking sample, the persisted foot targets and the
 * tuning parameters. Nothing here reads or writes the skeleton pose.
 */
class DriverResolver
{
public:
  [[nodiscard]] static DriverFrames resolve(const TrackingFrame& tracking,
                                            const LocomotionState& locomotion,
                                            const TuningParameters& params);

  /**
   * @brief Upright frame on the floor below the neck root
   *
   * Origin is the neck root projected onto y = 0, +Y is the world up axis and
   * -Z is the horizontal heading of the neck root. When the neck root looks
   * straight up or down the heading is taken from its +X axis instead.
   */
  [[nodiscard]] static ReferenceFrame computeBaseFrame(
    const ReferenceFrame& neckRoot);

  /// @brief Grip position combined with aim orientation
  [[nodiscard]] static ReferenceFrame computePalmFrame(
    const ReferenceFrame& grip,
    const ReferenceFrame& aim);

  /// @brief Foot placed at -/+ stanceHalfWidth along the base X axis
  [[nodiscard]] static ReferenceFrame defaultFootFrame(
    const ReferenceFrame& base,
    bool left,
    double stanceHalfWidth);

private:
  static constexpr double kVerticalEpsilon = 1e-9;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_DRIVER_RESOLVER_HPP

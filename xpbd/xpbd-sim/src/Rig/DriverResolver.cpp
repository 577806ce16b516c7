// Ticket: 0007_driver_resolver

#include "xpbd-sim/src/Rig/DriverResolver.hpp"

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace xpbd_sim
{

DriverFrames DriverResolver::resolve(const TrackingFrame& tracking,
                                     const LocomotionState& locomotion,
                                     const TuningParameters& params)
{
  DriverFrames frames;

  frames.hmd = tracking.hmd;
  frames.headCenter = tracking.hmd.translated(
    Coordinate{0.0, params.headCenterHeight, params.headCenterDepth});
  frames.neckRoot = frames.headCenter.translated(
    Coordinate{0.0, params.neckRootHeight, params.neckRootDepth});
  frames.base = computeBaseFrame(frames.neckRoot);

  Coordinate const leftWristInPalm{params.wristLateralOffset,
                                   params.wristVerticalOffset,
                                   params.wristDepthOffset};
  Coordinate const rightWristInPalm{-params.wristLateralOffset,
                                    params.wristVerticalOffset,
                                    params.wristDepthOffset};

  frames.leftGrip = tracking.leftGrip;
  frames.leftAim = tracking.leftAim;
  frames.leftPalm = computePalmFrame(tracking.leftGrip, tracking.leftAim);
  frames.leftWrist = frames.leftPalm.translated(leftWristInPalm);

  frames.rightGrip = tracking.rightGrip;
  frames.rightAim = tracking.rightAim;
  frames.rightPalm = computePalmFrame(tracking.rightGrip, tracking.rightAim);
  frames.rightWrist = frames.rightPalm.translated(rightWristInPalm);

  frames.leftFoot =
    locomotion.leftFoot.value_or(
      defaultFootFrame(frames.base, true, params.stanceHalfWidth));
  frames.rightFoot =
    locomotion.rightFoot.value_or(
      defaultFootFrame(frames.base, false, params.stanceHalfWidth));

  return frames;
}

ReferenceFrame DriverResolver::computeBaseFrame(const ReferenceFrame& neckRoot)
{
  Eigen::Vector3d const up = Eigen::Vector3d::UnitY();

  Eigen::Vector3d const forward = -neckRoot.zAxis().horizontal();

  Eigen::Vector3d back;
  if (forward.norm() > kVerticalEpsilon)
  {
    back = -forward.normalized();
  }
  else
  {
    // Looking straight up or down: the side axis still carries the heading
    Eigen::Vector3d right = neckRoot.xAxis().horizontal();
    if (right.norm() <= kVerticalEpsilon)
    {
      right = Eigen::Vector3d::UnitX();
    }
    back = right.normalized().cross(up);
  }

  Eigen::Vector3d const right = up.cross(back);

  Eigen::Matrix3d rotation;
  rotation.col(0) = right;
  rotation.col(1) = up;
  rotation.col(2) = back;

  return ReferenceFrame{neckRoot.getOrigin().horizontal(),
                        Eigen::Quaterniond{rotation}};
}

ReferenceFrame DriverResolver::computePalmFrame(const ReferenceFrame& grip,
                                                const ReferenceFrame& aim)
{
  return ReferenceFrame{grip.getOrigin(), aim.getOrientation()};
}

ReferenceFrame DriverResolver::defaultFootFrame(const ReferenceFrame& base,
                                                bool left,
                                                double stanceHalfWidth)
{
  double const lateral = left ? -stanceHalfWidth : stanceHalfWidth;
  return base.translated(Coordinate{lateral, 0.0, 0.0});
}

}  // namespace xpbd_sim

// Ticket: 0005_humanoid_anatomy

#include "xpbd-sim/src/Rig/HumanoidConstraintFactory.hpp"

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Skeleton/Landmark.hpp"

namespace xpbd_sim
{

ConstraintSet HumanoidConstraintFactory::build(const TuningParameters& params)
{
  Coordinate const leftWristInPalm{params.wristLateralOffset,
                                   params.wristVerticalOffset,
                                   params.wristDepthOffset};
  Coordinate const rightWristInPalm{-params.wristLateralOffset,
                                    params.wristVerticalOffset,
                                    params.wristDepthOffset};

  double const halfLowerArm = params.lowerArmLength / 2.0;
  double const halfUpperArm = params.upperArmLength / 2.0;
  double const halfUpperLeg = params.upperLegLength / 2.0;
  double const halfLowerLeg = params.lowerLegLength / 2.0;

  Coordinate const wristInLowerArm{0.0, 0.0, -halfLowerArm};
  Coordinate const elbowInLowerArm{0.0, 0.0, halfLowerArm};
  Coordinate const elbowInUpperArm{0.0, 0.0, -halfUpperArm};
  Coordinate const shoulderInUpperArm{0.0, 0.0, halfUpperArm};

  Coordinate const neckRootInHeadCenter{
    0.0, params.neckRootHeight, params.neckRootDepth};
  Coordinate const neckRootInTorso{0.0, params.neckRootHeightInTorso, 0.0};
  Coordinate const lowerBackInTorso{0.0, params.lowerBackHeightInTorso, 0.0};
  Coordinate const lowerBackInPelvis{0.0, params.lowerBackHeightInPelvis, 0.0};

  Coordinate const leftHipInPelvis{
    -params.hipWidth / 2.0, params.hipHeightInPelvis, 0.0};
  Coordinate const rightHipInPelvis{
    params.hipWidth / 2.0, params.hipHeightInPelvis, 0.0};
  Coordinate const hipInUpperLeg{0.0, halfUpperLeg, 0.0};
  Coordinate const kneeInUpperLeg{0.0, -halfUpperLeg, 0.0};
  Coordinate const kneeInLowerLeg{0.0, halfLowerLeg, 0.0};
  Coordinate const ankleInLowerLeg{0.0, -halfLowerLeg, 0.0};
  Coordinate const ankleInFoot{0.0, params.ankleHeight, 0.0};

  Coordinate const leftScJointInTorso{
    -params.sternumWidth / 2.0, params.sternumHeightInTorso, 0.0};
  Coordinate const rightScJointInTorso{
    params.sternumWidth / 2.0, params.sternumHeightInTorso, 0.0};

  ConstraintSet set;
  set.spherical.reserve(12);
  set.distance.reserve(2);

  // Wrists
  set.spherical.emplace_back(
    Landmark::LeftPalm, Landmark::LeftLowerArm, leftWristInPalm, wristInLowerArm);
  set.spherical.emplace_back(Landmark::RightPalm,
                             Landmark::RightLowerArm,
                             rightWristInPalm,
                             wristInLowerArm);

  // Elbows
  set.spherical.emplace_back(Landmark::LeftLowerArm,
                             Landmark::LeftUpperArm,
                             elbowInLowerArm,
                             elbowInUpperArm);
  set.spherical.emplace_back(Landmark::RightLowerArm,
                             Landmark::RightUpperArm,
                             elbowInLowerArm,
                             elbowInUpperArm);

  // Spine
  set.spherical.emplace_back(
    Landmark::HeadCenter, Landmark::Torso, neckRootInHeadCenter, neckRootInTorso);
  set.spherical.emplace_back(
    Landmark::Torso, Landmark::Pelvis, lowerBackInTorso, lowerBackInPelvis);

  // Hips
  set.spherical.emplace_back(
    Landmark::Pelvis, Landmark::LeftUpperLeg, leftHipInPelvis, hipInUpperLeg);
  set.spherical.emplace_back(
    Landmark::Pelvis, Landmark::RightUpperLeg, rightHipInPelvis, hipInUpperLeg);

  // Knees
  set.spherical.emplace_back(Landmark::LeftUpperLeg,
                             Landmark::LeftLowerLeg,
                             kneeInUpperLeg,
                             kneeInLowerLeg);
  set.spherical.emplace_back(Landmark::RightUpperLeg,
                             Landmark::RightLowerLeg,
                             kneeInUpperLeg,
                             kneeInLowerLeg);

  // Ankles
  set.spherical.emplace_back(
    Landmark::LeftLowerLeg, Landmark::LeftFoot, ankleInLowerLeg, ankleInFoot);
  set.spherical.emplace_back(
    Landmark::RightLowerLeg, Landmark::RightFoot, ankleInLowerLeg, ankleInFoot);

  // Collarbones
  set.distance.emplace_back(Landmark::LeftUpperArm,
                            Landmark::Torso,
                            shoulderInUpperArm,
                            leftScJointInTorso,
                            params.collarboneLength);
  set.distance.emplace_back(Landmark::RightUpperArm,
                            Landmark::Torso,
                            shoulderInUpperArm,
                            rightScJointInTorso,
                            params.collarboneLength);

  return set;
}

}  // namespace xpbd_sim

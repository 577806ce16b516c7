// Ticket: 0001_skeleton_node_store

#ifndef XPBD_SIM_SKELETON_LANDMARK_HPP
#define XPBD_SIM_SKELETON_LANDMARK_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace xpbd_sim
{

/**
 * @brief Closed set of skeletal and reference points tracked by the IK rig
 *
 * Declaration order is the storage index in SkeletonPose. Adding, removing or
 * reordering entries changes the node store layout; kLandmarkCount and
 * kAllLandmarks must be kept in sync.
 */
enum class Landmark : uint8_t
{
  Hmd,
  HeadCenter,
  NeckRoot,
  Torso,
  Pelvis,
  Base,
  BalancePoint,
  LeftAim,
  LeftGrip,
  LeftPalm,
  LeftWrist,
  LeftLowerArm,
  LeftUpperArm,
  LeftUpperLeg,
  LeftLowerLeg,
  LeftFoot,
  RightAim,
  RightGrip,
  RightPalm,
  RightWrist,
  RightLowerArm,
  RightUpperArm,
  RightUpperLeg,
  RightLowerLeg,
  RightFoot,
};

inline constexpr size_t kLandmarkCount =
  static_cast<size_t>(Landmark::RightFoot) + 1;

inline constexpr std::array<Landmark, kLandmarkCount> kAllLandmarks{
  Landmark::Hmd,           Landmark::HeadCenter,   Landmark::NeckRoot,
  Landmark::Torso,         Landmark::Pelvis,       Landmark::Base,
  Landmark::BalancePoint,  Landmark::LeftAim,      Landmark::LeftGrip,
  Landmark::LeftPalm,      Landmark::LeftWrist,    Landmark::LeftLowerArm,
  Landmark::LeftUpperArm,  Landmark::LeftUpperLeg, Landmark::LeftLowerLeg,
  Landmark::LeftFoot,      Landmark::RightAim,     Landmark::RightGrip,
  Landmark::RightPalm,     Landmark::RightWrist,   Landmark::RightLowerArm,
  Landmark::RightUpperArm, Landmark::RightUpperLeg, Landmark::RightLowerLeg,
  Landmark::RightFoot};

/// @brief Dense storage index of a landmark
constexpr size_t landmarkIndex(Landmark landmark)
{
  return static_cast<size_t>(landmark);
}

/**
 * @brief Stable human-readable landmark name
 *
 * Used for log output and by write-back sinks that key scene nodes by name.
 */
std::string_view landmarkName(Landmark landmark);

}  // namespace xpbd_sim

#endif  // XPBD_SIM_SKELETON_LANDMARK_HPP

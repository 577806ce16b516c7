// Ticket: 0001_skeleton_node_store

#include "xpbd-sim/src/Skeleton/Landmark.hpp"

namespace xpbd_sim
{

namespace
{

constexpr std::array<std::string_view, kLandmarkCount> kLandmarkNames{
  "Hmd",          "HeadCenter",   "NeckRoot",      "Torso",
  "Pelvis",       "Base",         "BalancePoint",  "LeftAim",
  "LeftGrip",     "LeftPalm",     "LeftWrist",     "LeftLowerArm",
  "LeftUpperArm", "LeftUpperLeg", "LeftLowerLeg",  "LeftFoot",
  "RightAim",     "RightGrip",    "RightPalm",     "RightWrist",
  "RightLowerArm", "RightUpperArm", "RightUpperLeg", "RightLowerLeg",
  "RightFoot"};

}  // namespace

std::string_view landmarkName(Landmark landmark)
{
  return kLandmarkNames[landmarkIndex(landmark)];
}

}  // namespace xpbd_sim

// Ticket: 0001_skeleton_node_store

#ifndef XPBD_SIM_SKELETON_POSE_HPP
#define XPBD_SIM_SKELETON_POSE_HPP

#include <Eigen/Geometry>
#include <array>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"
#include "xpbd-sim/src/Skeleton/Landmark.hpp"

namespace xpbd_sim
{

/**
 * @brief World-space position and orientation of every landmark
 *
 * Fixed-size arena indexed by landmarkIndex(). One instance persists per
 * simulated skeleton and is reused in place as the warm start of every solve;
 * it is only reset when the skeleton is (re)initialized.
 *
 * Orientations written through setOrientation()/setTransform() are
 * renormalized. The mutable orientation() accessor exists for the solver's
 * in-place update, which renormalizes after every correction itself.
 *
 * Thread safety: Not thread-safe (mutated in place every tick)
 */
class SkeletonPose
{
public:
  /**
   * @brief All landmarks at the origin with identity orientation
   */
  SkeletonPose();

  [[nodiscard]] const Coordinate& position(Landmark landmark) const
  {
    return positions_[landmarkIndex(landmark)];
  }

  [[nodiscard]] Coordinate& position(Landmark landmark)
  {
    return positions_[landmarkIndex(landmark)];
  }

  [[nodiscard]] const Eigen::Quaterniond& orientation(Landmark landmark) const
  {
    return orientations_[landmarkIndex(landmark)];
  }

  [[nodiscard]] Eigen::Quaterniond& orientation(Landmark landmark)
  {
    return orientations_[landmarkIndex(landmark)];
  }

  void setPosition(Landmark landmark, const Coordinate& position);

  /**
   * @brief Set a landmark orientation (normalized on entry)
   */
  void setOrientation(Landmark landmark, const Eigen::Quaterniond& orientation);

  /**
   * @brief Overwrite position and orientation from a rigid frame
   */
  void setTransform(Landmark landmark, const ReferenceFrame& frame);

  /**
   * @brief Current landmark pose as a rigid frame
   */
  [[nodiscard]] ReferenceFrame transform(Landmark landmark) const;

  /**
   * @brief Largest | |q| - 1 | over all landmark orientations
   */
  [[nodiscard]] double maxOrientationNormError() const;

private:
  std::array<Coordinate, kLandmarkCount> positions_;
  std::array<Eigen::Quaterniond, kLandmarkCount> orientations_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_SKELETON_POSE_HPP

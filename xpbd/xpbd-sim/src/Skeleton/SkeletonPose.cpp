// Ticket: 0001_skeleton_node_store

#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

#include <algorithm>

#include "xpbd-sim/src/Utils/utils.hpp"

namespace xpbd_sim
{

SkeletonPose::SkeletonPose()
{
  positions_.fill(Coordinate{0.0, 0.0, 0.0});
  orientations_.fill(Eigen::Quaterniond::Identity());
}

void SkeletonPose::setPosition(Landmark landmark, const Coordinate& position)
{
  positions_[landmarkIndex(landmark)] = position;
}

void SkeletonPose::setOrientation(Landmark landmark,
                                  const Eigen::Quaterniond& orientation)
{
  orientations_[landmarkIndex(landmark)] = orientation.normalized();
}

void SkeletonPose::setTransform(Landmark landmark, const ReferenceFrame& frame)
{
  setPosition(landmark, frame.getOrigin());
  setOrientation(landmark, frame.getOrientation());
}

ReferenceFrame SkeletonPose::transform(Landmark landmark) const
{
  return ReferenceFrame{position(landmark), orientation(landmark)};
}

double SkeletonPose::maxOrientationNormError() const
{
  double worst = 0.0;
  for (const auto& q : orientations_)
  {
    worst = std::max(worst, unitNormError(q));
  }
  return worst;
}

}  // namespace xpbd_sim

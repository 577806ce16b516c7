// Ticket: 0002_constraint_primitives

#include "xpbd-sim/src/Physics/Constraints/NodeConstraint.hpp"

namespace xpbd_sim
{

Coordinate NodeConstraint::leverArmA(const SkeletonPose& pose) const
{
  return pose.orientation(node_a_) * point_in_a_;
}

Coordinate NodeConstraint::leverArmB(const SkeletonPose& pose) const
{
  return pose.orientation(node_b_) * point_in_b_;
}

Coordinate NodeConstraint::worldAttachmentA(const SkeletonPose& pose) const
{
  return pose.position(node_a_) + leverArmA(pose);
}

Coordinate NodeConstraint::worldAttachmentB(const SkeletonPose& pose) const
{
  return pose.position(node_b_) + leverArmB(pose);
}

}  // namespace xpbd_sim

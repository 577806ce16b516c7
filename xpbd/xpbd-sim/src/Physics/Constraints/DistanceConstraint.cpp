// Ticket: 0002_constraint_primitives

#include "xpbd-sim/src/Physics/Constraints/DistanceConstraint.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace xpbd_sim
{

DistanceConstraint::DistanceConstraint(Landmark nodeA,
                                       Landmark nodeB,
                                       const Coordinate& pointInA,
                                       const Coordinate& pointInB,
                                       double restDistance)
  : NodeConstraint{nodeA, nodeB, pointInA, pointInB},
    restDistance_{restDistance}
{
  if (!std::isfinite(restDistance) || restDistance < 0.0)
  {
    throw std::invalid_argument(
      "DistanceConstraint: restDistance must be finite and non-negative, got " +
      std::to_string(restDistance));
  }
}

double DistanceConstraint::evaluate(const SkeletonPose& pose) const
{
  Coordinate const separation = worldAttachmentA(pose) - worldAttachmentB(pose);
  return separation.norm() - restDistance_;
}

}  // namespace xpbd_sim

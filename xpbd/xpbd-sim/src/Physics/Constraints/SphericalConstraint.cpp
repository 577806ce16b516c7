// Ticket: 0002_constraint_primitives

#include "xpbd-sim/src/Physics/Constraints/SphericalConstraint.hpp"

namespace xpbd_sim
{

SphericalConstraint::SphericalConstraint(Landmark nodeA,
                                         Landmark nodeB,
                                         const Coordinate& pointInA,
                                         const Coordinate& pointInB)
  : NodeConstraint{nodeA, nodeB, pointInA, pointInB}
{
}

Coordinate SphericalConstraint::evaluate(const SkeletonPose& pose) const
{
  return worldAttachmentA(pose) - worldAttachmentB(pose);
}

}  // namespace xpbd_sim

// Ticket: 0002_constraint_primitives

#include "xpbd-sim/src/Physics/Constraints/ConstraintSet.hpp"

#include <algorithm>
#include <cmath>

namespace xpbd_sim
{

double ConstraintSet::maxSphericalError(const SkeletonPose& pose) const
{
  double worst = 0.0;
  for (const auto& constraint : spherical)
  {
    worst = std::max(worst, constraint.evaluate(pose).norm());
  }
  return worst;
}

double ConstraintSet::maxDistanceError(const SkeletonPose& pose) const
{
  double worst = 0.0;
  for (const auto& constraint : distance)
  {
    worst = std::max(worst, std::abs(constraint.evaluate(pose)));
  }
  return worst;
}

}  // namespace xpbd_sim

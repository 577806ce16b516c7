// Ticket: 0002_constraint_primitives

#ifndef XPBD_SIM_PHYSICS_DISTANCE_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_DISTANCE_CONSTRAINT_HPP

#include <limits>

#include "xpbd-sim/src/Physics/Constraints/NodeConstraint.hpp"

namespace xpbd_sim
{

/**
 * @brief Fixed separation between attachment points on two skeleton nodes
 *
 * Mathematical formulation:
 * - Constraint: C = |p_A - p_B| - d = 0 (scalar constraint)
 * - p_A, p_B are the world images of the local attachment points
 *
 * Use cases:
 * - Collarbone: shoulder kept at a fixed reach from the sternum
 * - Any rod-like link where relative rotation at both ends is free
 *
 * Thread safety: Read-only after construction
 * Error handling: Throws std::invalid_argument if restDistance is negative
 * or not finite
 */
class DistanceConstraint : public NodeConstraint
{
public:
  /**
   * @param nodeA First body
   * @param nodeB Second body
   * @param pointInA Attachment in body A's frame [m]
   * @param pointInB Attachment in body B's frame [m]
   * @param restDistance Required separation [m]
   * @throws std::invalid_argument if restDistance < 0 or not finite
   */
  DistanceConstraint(Landmark nodeA,
                     Landmark nodeB,
                     const Coordinate& pointInA,
                     const Coordinate& pointInB,
                     double restDistance);

  /**
   * @brief Separation error |p_A - p_B| - restDistance [m]
   */
  [[nodiscard]] double evaluate(const SkeletonPose& pose) const;

  [[nodiscard]] double getRestDistance() const
  {
    return restDistance_;
  }

private:
  double restDistance_{std::numeric_limits<double>::quiet_NaN()};  // [m]
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_DISTANCE_CONSTRAINT_HPP

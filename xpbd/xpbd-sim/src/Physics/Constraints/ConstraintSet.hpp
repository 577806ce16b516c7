// Ticket: 0002_constraint_primitives

#ifndef XPBD_SIM_PHYSICS_CONSTRAINT_SET_HPP
#define XPBD_SIM_PHYSICS_CONSTRAINT_SET_HPP

#include <cstddef>
#include <vector>

#include "xpbd-sim/src/Physics/Constraints/DistanceConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/SphericalConstraint.hpp"

namespace xpbd_sim
{

/**
 * @brief Ordered constraint lists of one skeleton
 *
 * Encodes anatomy, not runtime state: built once when the skeleton is built
 * (or its dimensions are reloaded) and read-only while solving. Declaration
 * order is the Gauss-Seidel processing order.
 */
struct ConstraintSet
{
  std::vector<SphericalConstraint> spherical;
  std::vector<DistanceConstraint> distance;

  [[nodiscard]] size_t size() const
  {
    return spherical.size() + distance.size();
  }

  /// @brief Largest |C| over the spherical constraints [m]
  [[nodiscard]] double maxSphericalError(const SkeletonPose& pose) const;

  /// @brief Largest |C| over the distance constraints [m]
  [[nodiscard]] double maxDistanceError(const SkeletonPose& pose) const;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_CONSTRAINT_SET_HPP

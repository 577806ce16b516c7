// Ticket: 0002_constraint_primitives

#ifndef XPBD_SIM_PHYSICS_SPHERICAL_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_SPHERICAL_CONSTRAINT_HPP

#include "xpbd-sim/src/Physics/Constraints/NodeConstraint.hpp"

namespace xpbd_sim
{

/**
 * @brief Ball-joint constraint between two skeleton nodes
 *
 * Requires the world images of the two attachment points to coincide while
 * leaving relative rotation free:
 *
 *   C = (x_A + q_A ⊗ p_A) - (x_B + q_B ⊗ p_B) = 0   (vector constraint)
 *
 * Thread safety: Read-only after construction
 */
class SphericalConstraint : public NodeConstraint
{
public:
  /**
   * @param nodeA First body
   * @param nodeB Second body
   * @param pointInA Joint location in body A's frame [m]
   * @param pointInB Joint location in body B's frame [m]
   */
  SphericalConstraint(Landmark nodeA,
                      Landmark nodeB,
                      const Coordinate& pointInA,
                      const Coordinate& pointInB);

  /**
   * @brief Positional violation worldAttachmentA - worldAttachmentB [m]
   */
  [[nodiscard]] Coordinate evaluate(const SkeletonPose& pose) const;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SPHERICAL_CONSTRAINT_HPP

// Ticket: 0002_constraint_primitives

#ifndef XPBD_SIM_PHYSICS_NODE_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_NODE_CONSTRAINT_HPP

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Skeleton/Landmark.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

namespace xpbd_sim
{

/**
 * @brief Common data for constraints coupling two skeleton nodes
 *
 * Names two bodies by landmark and an attachment point fixed in each body's
 * local frame. Constraints reference the node store by index only and never
 * hold a pointer into it, so the solver can mutate the pose freely while
 * iterating over the constraint list.
 *
 * Immutable after construction. Not intended for polymorphic use: the solver
 * dispatches on the concrete constraint lists of a ConstraintSet.
 */
class NodeConstraint
{
public:
  [[nodiscard]] Landmark nodeA() const
  {
    return node_a_;
  }

  [[nodiscard]] Landmark nodeB() const
  {
    return node_b_;
  }

  /// @brief Attachment point in body A's local frame [m]
  [[nodiscard]] const Coordinate& pointInA() const
  {
    return point_in_a_;
  }

  /// @brief Attachment point in body B's local frame [m]
  [[nodiscard]] const Coordinate& pointInB() const
  {
    return point_in_b_;
  }

  /**
   * @brief Attachment offset of body A rotated into world axes
   *
   * r_A = q_A ⊗ pointInA ⊗ q_A*  (lever arm from the body origin)
   */
  [[nodiscard]] Coordinate leverArmA(const SkeletonPose& pose) const;

  /// @brief Attachment offset of body B rotated into world axes
  [[nodiscard]] Coordinate leverArmB(const SkeletonPose& pose) const;

  /// @brief World position of the attachment point on body A
  [[nodiscard]] Coordinate worldAttachmentA(const SkeletonPose& pose) const;

  /// @brief World position of the attachment point on body B
  [[nodiscard]] Coordinate worldAttachmentB(const SkeletonPose& pose) const;

protected:
  NodeConstraint(Landmark nodeA,
                 Landmark nodeB,
                 const Coordinate& pointInA,
                 const Coordinate& pointInB)
    : node_a_{nodeA},
      node_b_{nodeB},
      point_in_a_{pointInA},
      point_in_b_{pointInB}
  {
  }

  ~NodeConstraint() = default;
  NodeConstraint(const NodeConstraint&) = default;
  NodeConstraint& operator=(const NodeConstraint&) = default;
  NodeConstraint(NodeConstraint&&) noexcept = default;
  NodeConstraint& operator=(NodeConstraint&&) noexcept = default;

private:
  Landmark node_a_;
  Landmark node_b_;
  Coordinate point_in_a_;
  Coordinate point_in_b_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_NODE_CONSTRAINT_HPP

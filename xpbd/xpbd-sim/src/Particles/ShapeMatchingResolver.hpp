// Ticket: 0010_particle_substep

#ifndef XPBD_SIM_PARTICLES_SHAPE_MATCHING_RESOLVER_HPP
#define XPBD_SIM_PARTICLES_SHAPE_MATCHING_RESOLVER_HPP

#include <span>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Velocity.hpp"

namespace xpbd_sim
{

/**
 * @brief Shape-matching constraint projection for a particle soft body
 *
 * Owns its constraint collection (rest shapes, particle groupings, Lagrange
 * multipliers); the substep pipeline only hands over predicted positions.
 */
class ShapeMatchingResolver
{
public:
  virtual ~ShapeMatchingResolver() = default;

  /**
   * @brief Pull predicted positions toward their matched rigid shapes
   *
   * @param predicted Predicted particle positions, corrected in place [m]
   * @param compliance Inverse stiffness of the shape constraints
   * @param inverseMass Per-particle inverse mass [1/kg]
   * @param dt Substep duration [s]
   */
  virtual void resolve(std::span<Coordinate> predicted,
                       double compliance,
                       double inverseMass,
                       double dt) = 0;

  /**
   * @brief Damp velocities toward the matched rigid-body motion
   *
   * @param positions Positions at the end of the substep [m]
   * @param velocities Particle velocities, damped in place [m/s]
   * @param damping Fraction of deviating speed removed per second
   * @param dt Substep duration [s]
   */
  virtual void applyDamping(std::span<const Coordinate> positions,
                            std::span<Velocity> velocities,
                            double damping,
                            double dt) = 0;

protected:
  ShapeMatchingResolver() = default;
  ShapeMatchingResolver(const ShapeMatchingResolver&) = default;
  ShapeMatchingResolver& operator=(const ShapeMatchingResolver&) = default;
  ShapeMatchingResolver(ShapeMatchingResolver&&) noexcept = default;
  ShapeMatchingResolver& operator=(ShapeMatchingResolver&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PARTICLES_SHAPE_MATCHING_RESOLVER_HPP

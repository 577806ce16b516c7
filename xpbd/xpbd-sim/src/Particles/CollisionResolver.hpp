// Ticket: 0010_particle_substep

#ifndef XPBD_SIM_PARTICLES_COLLISION_RESOLVER_HPP
#define XPBD_SIM_PARTICLES_COLLISION_RESOLVER_HPP

#include <span>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"

namespace xpbd_sim
{

/**
 * @brief Projects predicted particle positions out of scene colliders
 */
class CollisionResolver
{
public:
  virtual ~CollisionResolver() = default;

  /**
   * @param predicted Predicted particle positions, corrected in place [m]
   * @param stictionFactor Maximum tangential correction per unit of normal
   *        correction
   */
  virtual void resolve(std::span<Coordinate> predicted,
                       double stictionFactor) = 0;

protected:
  CollisionResolver() = default;
  CollisionResolver(const CollisionResolver&) = default;
  CollisionResolver& operator=(const CollisionResolver&) = default;
  CollisionResolver(CollisionResolver&&) noexcept = default;
  CollisionResolver& operator=(CollisionResolver&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PARTICLES_COLLISION_RESOLVER_HPP

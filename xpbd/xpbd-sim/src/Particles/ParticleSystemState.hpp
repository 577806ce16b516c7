// Ticket: 0010_particle_substep

#ifndef XPBD_SIM_PARTICLES_PARTICLE_SYSTEM_STATE_HPP
#define XPBD_SIM_PARTICLES_PARTICLE_SYSTEM_STATE_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Velocity.hpp"

namespace xpbd_sim
{

/**
 * @brief Positions and velocities of a particle soft body
 *
 * Index-aligned: particle i is positions()[i] with velocities()[i]. Particles
 * can only be added as position/velocity pairs so the two sequences never
 * differ in length. Element values are mutable through the spans.
 */
class ParticleSystemState
{
public:
  ParticleSystemState() = default;

  /// @return Index of the new particle
  size_t addParticle(const Coordinate& position, const Velocity& velocity);

  void reserve(size_t count);

  [[nodiscard]] size_t size() const
  {
    return positions_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return positions_.empty();
  }

  [[nodiscard]] std::span<const Coordinate> positions() const
  {
    return positions_;
  }

  [[nodiscard]] std::span<Coordinate> positions()
  {
    return positions_;
  }

  [[nodiscard]] std::span<const Velocity> velocities() const
  {
    return velocities_;
  }

  [[nodiscard]] std::span<Velocity> velocities()
  {
    return velocities_;
  }

private:
  std::vector<Coordinate> positions_;  // [m]
  std::vector<Velocity> velocities_;   // [m/s]
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PARTICLES_PARTICLE_SYSTEM_STATE_HPP

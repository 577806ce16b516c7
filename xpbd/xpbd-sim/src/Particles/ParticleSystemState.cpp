// Ticket: 0010_particle_substep

#include "xpbd-sim/src/Particles/ParticleSystemState.hpp"

namespace xpbd_sim
{

size_t ParticleSystemState::addParticle(const Coordinate& position,
                                        const Velocity& velocity)
{
  positions_.push_back(position);
  velocities_.push_back(velocity);
  return positions_.size() - 1;
}

void ParticleSystemState::reserve(size_t count)
{
  positions_.reserve(count);
  velocities_.reserve(count);
}

}  // namespace xpbd_sim

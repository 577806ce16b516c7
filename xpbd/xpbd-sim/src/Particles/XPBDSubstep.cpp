// Ticket: 0010_particle_substep

#include "xpbd-sim/src/Particles/XPBDSubstep.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace xpbd_sim
{

XPBDSubstep::XPBDSubstep() : XPBDSubstep{Config{}}
{
}

XPBDSubstep::XPBDSubstep(const Config& config) : config_{config}
{
  if (!std::isfinite(config_.dt) || config_.dt <= 0.0)
  {
    throw std::invalid_argument("XPBDSubstep: dt must be positive, got " +
                                std::to_string(config_.dt));
  }
  if (!std::isfinite(config_.particleMass) || config_.particleMass <= 0.0)
  {
    throw std::invalid_argument(
      "XPBDSubstep: particleMass must be positive, got " +
      std::to_string(config_.particleMass));
  }
}

void XPBDSubstep::step(ParticleSystemState& state,
                       ShapeMatchingResolver& shapeMatching,
                       CollisionResolver& collision)
{
  double const dt = config_.dt;
  auto positions = state.positions();
  auto velocities = state.velocities();
  size_t const count = state.size();

  // ===== Step 1: External forces =====
  for (auto& velocity : velocities)
  {
    velocity += config_.acceleration * dt;
  }

  // ===== Step 2: Predict =====
  predicted_.resize(count);
  for (size_t i = 0; i < count; ++i)
  {
    predicted_[i] = positions[i] + velocities[i] * dt;
  }

  // ===== Steps 3-4: Projections =====
  shapeMatching.resolve(
    predicted_, config_.shapeCompliance, 1.0 / config_.particleMass, dt);
  collision.resolve(predicted_, config_.stictionFactor);

  // ===== Step 5: Velocities from realized displacement =====
  for (size_t i = 0; i < count; ++i)
  {
    velocities[i] = (predicted_[i] - positions[i]) / dt;
  }

  // ===== Step 6: Damping =====
  shapeMatching.applyDamping(
    predicted_, velocities, config_.shapeDamping, dt);

  // ===== Step 7: Commit =====
  for (size_t i = 0; i < count; ++i)
  {
    positions[i] = predicted_[i];
  }
}

}  // namespace xpbd_sim

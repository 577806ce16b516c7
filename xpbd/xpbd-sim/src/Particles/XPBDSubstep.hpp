// Ticket: 0010_particle_substep

#ifndef XPBD_SIM_PARTICLES_XPBD_SUBSTEP_HPP
#define XPBD_SIM_PARTICLES_XPBD_SUBSTEP_HPP

#include <vector>

#include "xpbd-sim/src/DataTypes/Acceleration.hpp"
#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Particles/CollisionResolver.hpp"
#include "xpbd-sim/src/Particles/ParticleSystemState.hpp"
#include "xpbd-sim/src/Particles/ShapeMatchingResolver.hpp"

namespace xpbd_sim
{

/**
 * @brief One XPBD substep of a particle soft body
 *
 * Order of operations:
 * 1. v += a * dt                      (external acceleration)
 * 2. x_next = x + v * dt              (prediction)
 * 3. shape matching on x_next
 * 4. collision projection on x_next
 * 5. v = (x_next - x) / dt            (velocity from realized displacement)
 * 6. shape-matching damping on v
 * 7. x = x_next
 *
 * Velocities are always reconciled from where particles actually ended up,
 * so any displacement the projections introduce shows up as velocity.
 *
 * Thread safety: Not thread-safe (keeps a prediction buffer between calls)
 */
class XPBDSubstep
{
public:
  struct Config
  {
    double dt{1.0 / 360.0};                       ///< Substep duration [s]
    Acceleration acceleration{0.0, -9.81, 0.0};   ///< External acceleration [m/s^2]
    double particleMass{1.0};                     ///< Per-particle mass [kg]
    double shapeCompliance{0.0};                  ///< Inverse shape stiffness
    double shapeDamping{0.0};                     ///< Speed fraction removed per second
    double stictionFactor{0.0};                   ///< Tangential/normal correction cap
  };

  XPBDSubstep();

  /// @throws std::invalid_argument if dt <= 0 or particleMass <= 0
  explicit XPBDSubstep(const Config& config);

  /**
   * @brief Advance the particle system by one substep
   *
   * Collaborator exceptions propagate; the state is then left with
   * velocities updated by step 1 and positions unchanged.
   */
  void step(ParticleSystemState& state,
            ShapeMatchingResolver& shapeMatching,
            CollisionResolver& collision);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
  std::vector<Coordinate> predicted_;  // Reused between substeps
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PARTICLES_XPBD_SUBSTEP_HPP

// Ticket: 0011_engine_tick

#ifndef XPBD_ENGINE_HPP
#define XPBD_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

#include "xpbd-sim/src/Particles/CollisionResolver.hpp"
#include "xpbd-sim/src/Particles/ParticleSystemState.hpp"
#include "xpbd-sim/src/Particles/ShapeMatchingResolver.hpp"
#include "xpbd-sim/src/Particles/XPBDSubstep.hpp"
#include "xpbd-sim/src/Rig/IKRig.hpp"
#include "xpbd-sim/src/Rig/PoseSink.hpp"
#include "xpbd-sim/src/Rig/TrackingInput.hpp"
#include "xpbd-sim/src/Rig/TuningParameters.hpp"

namespace xpbd_sim
{

/**
 * @brief Top-level per-frame orchestrator
 *
 * Owns the IK rig with its cross-tick state and, optionally, one particle
 * soft body with its shape-matching and collision collaborators. Each
 * update() runs one IK tick followed by a fixed number of particle substeps.
 *
 * @note Not thread-safe. Single-threaded simulation assumed.
 */
class Engine
{
public:
  /// @brief Particle substep schedule
  struct Config
  {
    XPBDSubstep::Config substep;
    int substepsPerTick{1};
  };

  /**
   * @param params IK rig tuning
   * @param logger Logger shared with the rig (spdlog default logger if null)
   */
  explicit Engine(const TuningParameters& params,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Attach a particle soft body to be advanced after every IK tick
   *
   * Replaces any previously attached system.
   *
   * @throws std::invalid_argument if a collaborator is null, substepsPerTick
   *         is negative, or the substep config is invalid
   */
  void attachParticleSystem(ParticleSystemState state,
                            std::unique_ptr<ShapeMatchingResolver> shapeMatching,
                            std::unique_ptr<CollisionResolver> collision,
                            const Config& config);

  /**
   * @brief Advance one frame: IK tick, then particle substeps
   *
   * Sink failures are reported in the result; collaborator exceptions
   * propagate after the IK tick has been committed.
   */
  TickResult update(const TrackingFrame& tracking, PoseSink* sink = nullptr);

  /// @brief Hot-reload rig tuning
  void setParameters(const TuningParameters& params);

  [[nodiscard]] const IKRig& getRig() const
  {
    return rig_;
  }

  [[nodiscard]] const RigState& getRigState() const
  {
    return rigState_;
  }

  /// @return Attached particle state, or nullptr if none
  [[nodiscard]] const ParticleSystemState* getParticles() const;

  [[nodiscard]] uint64_t getSubstepCount() const
  {
    return substepCount_;
  }

private:
  struct ParticleSystem
  {
    ParticleSystemState state;
    std::unique_ptr<ShapeMatchingResolver> shapeMatching;
    std::unique_ptr<CollisionResolver> collision;
    XPBDSubstep substep;
    int substepsPerTick{1};
  };

  IKRig rig_;
  RigState rigState_;
  std::optional<ParticleSystem> particles_;
  uint64_t substepCount_{0};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace xpbd_sim

#endif  // XPBD_ENGINE_HPP

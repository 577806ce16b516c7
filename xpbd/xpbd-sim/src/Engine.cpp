// Ticket: 0011_engine_tick

#include "xpbd-sim/src/Engine.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace xpbd_sim
{

Engine::Engine(const TuningParameters& params,
               std::shared_ptr<spdlog::logger> logger)
  : rig_{params, logger},
    logger_{rig_.getLogger()}
{
}

void Engine::attachParticleSystem(
  ParticleSystemState state,
  std::unique_ptr<ShapeMatchingResolver> shapeMatching,
  std::unique_ptr<CollisionResolver> collision,
  const Config& config)
{
  if (!shapeMatching || !collision)
  {
    throw std::invalid_argument(
      "Engine: particle system requires shape-matching and collision "
      "resolvers");
  }
  if (config.substepsPerTick < 0)
  {
    throw std::invalid_argument("Engine: substepsPerTick must be >= 0");
  }

  particles_.emplace(ParticleSystem{std::move(state),
                                    std::move(shapeMatching),
                                    std::move(collision),
                                    XPBDSubstep{config.substep},
                                    config.substepsPerTick});

  logger_->info("Engine: attached {} particles, {} substeps of {} s per tick",
                particles_->state.size(),
                config.substepsPerTick,
                config.substep.dt);
}

TickResult Engine::update(const TrackingFrame& tracking, PoseSink* sink)
{
  TickResult const result = rig_.tick(rigState_, tracking, sink);

  if (particles_)
  {
    for (int i = 0; i < particles_->substepsPerTick; ++i)
    {
      particles_->substep.step(
        particles_->state, *particles_->shapeMatching, *particles_->collision);
      ++substepCount_;
    }
  }

  return result;
}

void Engine::setParameters(const TuningParameters& params)
{
  rig_.setParameters(params);
}

const ParticleSystemState* Engine::getParticles() const
{
  return particles_ ? &particles_->state : nullptr;
}

}  // namespace xpbd_sim

// Ticket: 0010_particle_substep

#include <benchmark/benchmark.h>
#include <random>
#include <span>

#include "xpbd-sim/src/Particles/CollisionResolver.hpp"
#include "xpbd-sim/src/Particles/ParticleSystemState.hpp"
#include "xpbd-sim/src/Particles/ShapeMatchingResolver.hpp"
#include "xpbd-sim/src/Particles/XPBDSubstep.hpp"

using namespace xpbd_sim;

namespace
{

class NoShapeMatching : public ShapeMatchingResolver
{
public:
  void resolve(std::span<Coordinate> /* predicted */,
               double /* compliance */,
               double /* inverseMass */,
               double /* dt */) override
  {
  }

  void applyDamping(std::span<const Coordinate> /* positions */,
                    std::span<Velocity> /* velocities */,
                    double /* damping */,
                    double /* dt */) override
  {
  }
};

class FloorCollision : public CollisionResolver
{
public:
  void resolve(std::span<Coordinate> predicted,
               double /* stictionFactor */) override
  {
    for (auto& position : predicted)
    {
      if (position.y() < 0.0)
      {
        position.y() = 0.0;
      }
    }
  }
};

// Random cloud above the floor with fixed seed for reproducibility
ParticleSystemState generateCloud(size_t count)
{
  std::mt19937 rng{42};
  std::uniform_real_distribution<double> horizontal{-1.0, 1.0};
  std::uniform_real_distribution<double> height{0.0, 2.0};

  ParticleSystemState state;
  state.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    state.addParticle(Coordinate{horizontal(rng), height(rng), horizontal(rng)},
                      Velocity{0.0, 0.0, 0.0});
  }
  return state;
}

}  // namespace

/**
 * @brief One substep of a falling particle cloud against a floor plane
 *
 * Measures the pipeline overhead itself: shape matching is a no-op.
 */
static void BM_XPBDSubstep_Step(benchmark::State& state)
{
  size_t const count = static_cast<size_t>(state.range(0));
  ParticleSystemState particles = generateCloud(count);
  XPBDSubstep substep;
  NoShapeMatching shape;
  FloorCollision floor;

  for (auto _ : state)
  {
    substep.step(particles, shape, floor);
    benchmark::ClobberMemory();
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_XPBDSubstep_Step)
  ->RangeMultiplier(4)
  ->Range(64, 16384)
  ->Complexity(benchmark::oN);

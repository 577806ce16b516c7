// Ticket: 0011_engine_tick

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "xpbd-sim/src/Engine.hpp"
#include "xpbd-sim/test/Helpers/TrackingFixtures.hpp"

using namespace xpbd_sim;

namespace
{

Engine::Config fallingParticles(int substepsPerTick)
{
  Engine::Config config;
  config.substep.dt = 0.01;
  config.substep.acceleration = Acceleration{0.0, -10.0, 0.0};
  config.substepsPerTick = substepsPerTick;
  return config;
}

ParticleSystemState singleParticle(double height)
{
  ParticleSystemState state;
  state.addParticle(Coordinate{0.0, height, 0.0}, Velocity{0.0, 0.0, 0.0});
  return state;
}

}  // namespace

TEST(EngineTest, UpdateWithoutParticlesRunsRigOnly)
{
  Engine engine{TuningParameters{}, test::makeNullLogger()};
  test::RecordingPoseSink sink;

  auto const result = engine.update(test::standingTracking(), &sink);

  EXPECT_EQ(engine.getRigState().tickCount, 1u);
  EXPECT_EQ(engine.getParticles(), nullptr);
  EXPECT_EQ(engine.getSubstepCount(), 0u);
  EXPECT_EQ(sink.records.size(), kLandmarkCount);
  EXPECT_EQ(result.solve.iterations, 10);
}

TEST(EngineTest, SubstepsRunAfterEveryTick)
{
  Engine engine{TuningParameters{}, test::makeNullLogger()};
  engine.attachParticleSystem(singleParticle(1.0),
                              std::make_unique<test::IdentityShapeMatching>(),
                              std::make_unique<test::FloorCollision>(),
                              fallingParticles(3));

  (void)engine.update(test::standingTracking());
  (void)engine.update(test::standingTracking());

  EXPECT_EQ(engine.getSubstepCount(), 6u);
  ASSERT_NE(engine.getParticles(), nullptr);

  // Six semi-implicit substeps from rest: y = 1 - a dt^2 (1 + 2 + ... + 6)
  EXPECT_NEAR(engine.getParticles()->positions()[0].y(), 1.0 - 0.021, 1e-12);
  EXPECT_NEAR(engine.getParticles()->velocities()[0].y(), -0.6, 1e-9);
}

TEST(EngineTest, FloorStopsParticles)
{
  Engine engine{TuningParameters{}, test::makeNullLogger()};
  engine.attachParticleSystem(singleParticle(0.05),
                              std::make_unique<test::IdentityShapeMatching>(),
                              std::make_unique<test::FloorCollision>(),
                              fallingParticles(10));

  for (int i = 0; i < 20; ++i)
  {
    (void)engine.update(test::standingTracking());
  }

  EXPECT_NEAR(engine.getParticles()->positions()[0].y(), 0.0, 1e-12);
  // Resting particle only ever gains one substep of gravity
  EXPECT_NEAR(engine.getParticles()->velocities()[0].y(), 0.0, 1e-9);
}

TEST(EngineTest, AttachRejectsMissingCollaborators)
{
  Engine engine{TuningParameters{}, test::makeNullLogger()};

  EXPECT_THROW(engine.attachParticleSystem(
                 singleParticle(1.0),
                 nullptr,
                 std::make_unique<test::IdentityCollision>(),
                 fallingParticles(1)),
               std::invalid_argument);
  EXPECT_THROW(engine.attachParticleSystem(
                 singleParticle(1.0),
                 std::make_unique<test::IdentityShapeMatching>(),
                 nullptr,
                 fallingParticles(1)),
               std::invalid_argument);

  Engine::Config badDt = fallingParticles(1);
  badDt.substep.dt = 0.0;
  EXPECT_THROW(engine.attachParticleSystem(
                 singleParticle(1.0),
                 std::make_unique<test::IdentityShapeMatching>(),
                 std::make_unique<test::IdentityCollision>(),
                 badDt),
               std::invalid_argument);

  EXPECT_EQ(engine.getParticles(), nullptr);
}

TEST(EngineTest, SetParametersReachesRig)
{
  Engine engine{TuningParameters{}, test::makeNullLogger()};
  TuningParameters params;
  params.set("solver_iterations", 4.0);

  engine.setParameters(params);
  auto const result = engine.update(test::standingTracking());

  EXPECT_EQ(result.solve.iterations, 4);
  EXPECT_EQ(engine.getRig().getParameters().iterationCount(), 4);
}

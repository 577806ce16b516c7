#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <numbers>
#include <span>
#include <utility>

#include <Eigen/Geometry>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Engine.hpp"
#include "xpbd-sim/src/Particles/CollisionResolver.hpp"
#include "xpbd-sim/src/Particles/ShapeMatchingResolver.hpp"
#include "xpbd-sim/src/Rig/PoseSink.hpp"
#include "xpbd-sim/src/Rig/TrackingInput.hpp"

namespace
{

constexpr double kFrameRate = 72.0;     // [Hz]
constexpr int kFrameCount = 720;        // 10 s of tracking
constexpr double kWalkSpeed = 0.6;      // [m/s]
constexpr double kHeadHeight = 1.6;     // [m]

/// Headset walking forward (-Z) with a lateral sway, hands swinging
class ScriptedTrackingSource : public xpbd_sim::TrackingSource
{
public:
  xpbd_sim::TrackingFrame sample() override
  {
    using xpbd_sim::Coordinate;
    using xpbd_sim::ReferenceFrame;

    double const t = static_cast<double>(frame_) / kFrameRate;
    double const phase = 2.0 * std::numbers::pi * 0.9 * t;
    double const sway = 0.04 * std::sin(phase);
    double const swing = 0.15 * std::sin(phase);
    double const z = -kWalkSpeed * t;

    Eigen::Quaterniond const yaw{
      Eigen::AngleAxisd{0.1 * std::sin(0.5 * phase), Eigen::Vector3d::UnitY()}};

    xpbd_sim::TrackingFrame tracking;
    tracking.hmd = ReferenceFrame{Coordinate{sway, kHeadHeight, z}, yaw};

    Eigen::Quaterniond const armDown{
      Eigen::AngleAxisd{-0.3, Eigen::Vector3d::UnitX()}};
    tracking.leftGrip =
      ReferenceFrame{Coordinate{-0.25, 0.9, z - swing}, armDown};
    tracking.leftAim = tracking.leftGrip;
    tracking.rightGrip =
      ReferenceFrame{Coordinate{0.25, 0.9, z + swing}, armDown};
    tracking.rightAim = tracking.rightGrip;

    // Request one snapshot halfway through the walk
    tracking.menuButtonJustPressed = frame_ == kFrameCount / 2;

    ++frame_;
    return tracking;
  }

private:
  int64_t frame_{0};
};

/// Logs the head and foot nodes; snapshots dump every landmark
class LoggingPoseSink : public xpbd_sim::PoseSink
{
public:
  explicit LoggingPoseSink(std::shared_ptr<spdlog::logger> logger)
    : logger_{std::move(logger)}
  {
  }

  void applyNodeTransform(xpbd_sim::Landmark landmark,
                          const xpbd_sim::Coordinate& position,
                          const Eigen::Quaterniond& /* orientation */) override
  {
    if (landmark == xpbd_sim::Landmark::LeftFoot ||
        landmark == xpbd_sim::Landmark::RightFoot)
    {
      logger_->trace("{} at ({:.3f}, {:.3f}, {:.3f})",
                     xpbd_sim::landmarkName(landmark),
                     position.x(),
                     position.y(),
                     position.z());
    }
  }

  void onSnapshotRequested(const xpbd_sim::SkeletonPose& pose) override
  {
    for (xpbd_sim::Landmark const landmark : xpbd_sim::kAllLandmarks)
    {
      const auto& position = pose.position(landmark);
      const auto& q = pose.orientation(landmark);
      logger_->info(
        "snapshot {} pos=({:.3f}, {:.3f}, {:.3f}) rot=({:.3f}, {:.3f}, "
        "{:.3f}, {:.3f})",
        xpbd_sim::landmarkName(landmark),
        position.x(),
        position.y(),
        position.z(),
        q.w(),
        q.x(),
        q.y(),
        q.z());
    }
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

/// Rigid shape matching is out of scope for the demo
class NoShapeMatching : public xpbd_sim::ShapeMatchingResolver
{
public:
  void resolve(std::span<xpbd_sim::Coordinate> /* predicted */,
               double /* compliance */,
               double /* inverseMass */,
               double /* dt */) override
  {
  }

  void applyDamping(std::span<const xpbd_sim::Coordinate> /* positions */,
                    std::span<xpbd_sim::Velocity> /* velocities */,
                    double /* damping */,
                    double /* dt */) override
  {
  }
};

/// Floor plane at y = 0
class FloorCollision : public xpbd_sim::CollisionResolver
{
public:
  void resolve(std::span<xpbd_sim::Coordinate> predicted,
               double /* stictionFactor */) override
  {
    for (auto& position : predicted)
    {
      position.y() = std::max(position.y(), 0.0);
    }
  }
};

}  // namespace

int main()
{
  auto logger = spdlog::stdout_color_mt("xpbd");
  logger->set_level(spdlog::level::debug);

  xpbd_sim::Engine engine{xpbd_sim::TuningParameters{}, logger};

  xpbd_sim::ParticleSystemState particles;
  for (int i = 0; i < 8; ++i)
  {
    particles.addParticle(
      xpbd_sim::Coordinate{0.1 * i, 1.0 + 0.05 * i, -1.0},
      xpbd_sim::Velocity{0.0, 0.0, 0.0});
  }

  xpbd_sim::Engine::Config particleConfig;
  particleConfig.substep.dt = 1.0 / (kFrameRate * 4.0);
  particleConfig.substepsPerTick = 4;
  engine.attachParticleSystem(std::move(particles),
                              std::make_unique<NoShapeMatching>(),
                              std::make_unique<FloorCollision>(),
                              particleConfig);

  ScriptedTrackingSource source;
  LoggingPoseSink sink{logger};

  for (int frame = 0; frame < kFrameCount; ++frame)
  {
    auto const result = engine.update(source.sample(), &sink);
    if (frame % static_cast<int>(kFrameRate) == 0)
    {
      logger->info("frame {}: {} residual spherical={:.2e} distance={:.2e}",
                   frame,
                   xpbd_sim::weightDistributionName(
                     result.locomotion.distribution),
                   result.solve.maxSphericalError,
                   result.solve.maxDistanceError);
    }
  }

  logger->info("done: {} ticks, {} particle substeps",
               engine.getRigState().tickCount,
               engine.getSubstepCount());
  return 0;
}

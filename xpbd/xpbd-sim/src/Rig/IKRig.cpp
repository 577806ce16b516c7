// Ticket: 0009_ik_rig_tick

#include "xpbd-sim/src/Rig/IKRig.hpp"

#include <cstdint>
#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Rig/HumanoidConstraintFactory.hpp"

namespace xpbd_sim
{

namespace
{

constexpr std::array<Landmark, IKRig::kDrivenCount> kDrivenLandmarks{
  Landmark::Hmd,
  Landmark::HeadCenter,
  Landmark::NeckRoot,
  Landmark::Base,
  Landmark::BalancePoint,
  Landmark::LeftGrip,
  Landmark::LeftAim,
  Landmark::LeftPalm,
  Landmark::LeftWrist,
  Landmark::RightGrip,
  Landmark::RightAim,
  Landmark::RightPalm,
  Landmark::RightWrist,
  Landmark::LeftFoot,
  Landmark::RightFoot};

GaussSeidelSolver::Config solverConfig(const TuningParameters& params)
{
  GaussSeidelSolver::Config config;
  config.iterations = params.iterationCount();
  return config;
}

}  // namespace

IKRig::IKRig(const TuningParameters& params,
             std::shared_ptr<spdlog::logger> logger)
  : params_{params},
    constraints_{HumanoidConstraintFactory::build(params)},
    locomotion_{locomotionConfig(params)},
    solver_{solverConfig(params)},
    logger_{logger ? std::move(logger) : spdlog::default_logger()}
{
  logger_->info("IKRig: {} spherical and {} distance constraints, {} iterations",
                constraints_.spherical.size(),
                constraints_.distance.size(),
                solver_.getConfig().iterations);
}

void IKRig::setParameters(const TuningParameters& params)
{
  // Build everything before committing so a throw leaves the rig unchanged
  ConstraintSet constraints = HumanoidConstraintFactory::build(params);
  LocomotionController const locomotion{locomotionConfig(params)};
  GaussSeidelSolver const solver{solverConfig(params)};

  params_ = params;
  constraints_ = std::move(constraints);
  locomotion_ = locomotion;
  solver_ = solver;

  logger_->info("IKRig: parameters reloaded ({} iterations)",
                solver_.getConfig().iterations);
}

std::span<const Landmark> IKRig::drivenLandmarks()
{
  return kDrivenLandmarks;
}

LocomotionController::Config IKRig::locomotionConfig(
  const TuningParameters& params)
{
  LocomotionController::Config config;
  config.footRadius = params.footRadius;
  config.stepMultiplier = params.stepMultiplier;
  config.staggerThreshold = params.staggerThreshold();
  config.stepSize = params.stepSize();
  return config;
}

TickResult IKRig::tick(RigState& state,
                       const TrackingFrame& tracking,
                       PoseSink* sink) const
{
  TickResult result;
  uint64_t const tick = state.tickCount;

  DriverFrames const drivers =
    DriverResolver::resolve(tracking, state.locomotion, params_);

  WeightDistribution const previous = state.locomotion.distribution;
  result.locomotion = locomotion_.update(
    state.locomotion, drivers.base, drivers.leftFoot, drivers.rightFoot);

  if (result.locomotion.distribution != previous)
  {
    logger_->debug(
      "IKRig: tick {} weight distribution {} -> {}, balance point {}",
      tick,
      weightDistributionName(previous),
      weightDistributionName(result.locomotion.distribution),
      std::format("{:.3f}", result.locomotion.balancePointInBase));
  }

  auto const seeds = drivenNodes(drivers, result.locomotion);
  result.solve = solver_.solve(state.pose, seeds, constraints_);

  if (result.solve.skippedCorrections > 0)
  {
    logger_->warn("IKRig: tick {} skipped {} degenerate corrections",
                  tick,
                  result.solve.skippedCorrections);
  }
  logger_->trace("IKRig: tick {} residual spherical={} distance={}",
                 tick,
                 result.solve.maxSphericalError,
                 result.solve.maxDistanceError);

  ++state.tickCount;

  if (sink == nullptr)
  {
    return result;
  }

  result.sinkFailures = writeBack(state.pose, *sink);

  if (tracking.menuButtonJustPressed)
  {
    result.snapshotRequested = true;
    logger_->info("IKRig: snapshot requested at tick {}", tick);
    try
    {
      sink->onSnapshotRequested(state.pose);
    }
    catch (const std::exception& e)
    {
      ++result.sinkFailures;
      logger_->error("IKRig: snapshot request failed: {}", e.what());
    }
  }

  return result;
}

std::array<DrivenNode, IKRig::kDrivenCount> IKRig::drivenNodes(
  const DriverFrames& drivers,
  const LocomotionDecision& locomotion)
{
  ReferenceFrame const balancePoint =
    drivers.base.translated(locomotion.balancePointInBase);

  return {DrivenNode{Landmark::Hmd, drivers.hmd},
          DrivenNode{Landmark::HeadCenter, drivers.headCenter},
          DrivenNode{Landmark::NeckRoot, drivers.neckRoot},
          DrivenNode{Landmark::Base, drivers.base},
          DrivenNode{Landmark::BalancePoint, balancePoint},
          DrivenNode{Landmark::LeftGrip, drivers.leftGrip},
          DrivenNode{Landmark::LeftAim, drivers.leftAim},
          DrivenNode{Landmark::LeftPalm, drivers.leftPalm},
          DrivenNode{Landmark::LeftWrist, drivers.leftWrist},
          DrivenNode{Landmark::RightGrip, drivers.rightGrip},
          DrivenNode{Landmark::RightAim, drivers.rightAim},
          DrivenNode{Landmark::RightPalm, drivers.rightPalm},
          DrivenNode{Landmark::RightWrist, drivers.rightWrist},
          DrivenNode{Landmark::LeftFoot, locomotion.leftFoot},
          DrivenNode{Landmark::RightFoot, locomotion.rightFoot}};
}

size_t IKRig::writeBack(const SkeletonPose& pose, PoseSink& sink) const
{
  size_t failures = 0;
  for (Landmark const landmark : kAllLandmarks)
  {
    try
    {
      sink.applyNodeTransform(
        landmark, pose.position(landmark), pose.orientation(landmark));
    }
    catch (const std::exception& e)
    {
      ++failures;
      logger_->error("IKRig: write-back of {} failed: {}",
                     landmarkName(landmark),
                     e.what());
    }
  }
  return failures;
}

}  // namespace xpbd_sim

// Ticket: 0008_locomotion_state_machine

#include "xpbd-sim/src/Rig/LocomotionController.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace xpbd_sim
{

std::string_view weightDistributionName(WeightDistribution distribution)
{
  switch (distribution)
  {
    case WeightDistribution::LeftPlanted:
      return "LeftPlanted";
    case WeightDistribution::RightPlanted:
      return "RightPlanted";
    case WeightDistribution::SharedWeight:
      return "SharedWeight";
  }
  return "Unknown";
}

LocomotionController::LocomotionController() : LocomotionController{Config{}}
{
}

LocomotionController::LocomotionController(const Config& config)
  : config_{config}
{
  validate(config_);
}

void LocomotionController::setConfig(const Config& config)
{
  validate(config);
  config_ = config;
}

void LocomotionController::validate(const Config& config)
{
  for (double const value : {config.footRadius,
                             config.stepMultiplier,
                             config.staggerThreshold,
                             config.stepSize})
  {
    if (!std::isfinite(value) || value < 0.0)
    {
      throw std::invalid_argument(
        "LocomotionController: config values must be finite and "
        "non-negative");
    }
  }
}

WeightDistribution LocomotionController::classify(const Coordinate& leftInBase,
                                                  const Coordinate& rightInBase,
                                                  double footRadius,
                                                  WeightDistribution previous)
{
  bool const leftNear = leftInBase.norm() < footRadius;
  bool const rightNear = rightInBase.norm() < footRadius;

  if (leftNear && rightNear)
  {
    return previous;
  }
  if (leftNear)
  {
    return WeightDistribution::LeftPlanted;
  }
  if (rightNear)
  {
    return WeightDistribution::RightPlanted;
  }
  return WeightDistribution::SharedWeight;
}

Coordinate LocomotionController::balancePoint(const Coordinate& a,
                                              const Coordinate& b)
{
  Coordinate const segment = b - a;
  double const lengthSquared = segment.squaredNorm();
  if (lengthSquared < kDegenerateSegmentSquared)
  {
    return a;
  }

  // Origin projected onto the segment: t = (0 - a) . v / |v|^2
  double const t = std::clamp((-a).dot(segment) / lengthSquared, 0.0, 1.0);
  return a + t * segment;
}

LocomotionDecision LocomotionController::update(
  LocomotionState& state,
  const ReferenceFrame& base,
  const ReferenceFrame& leftFoot,
  const ReferenceFrame& rightFoot) const
{
  // ===== Step 1: Feet in the base frame =====
  Coordinate const leftInBase = base.globalToLocal(leftFoot.getOrigin());
  Coordinate const rightInBase = base.globalToLocal(rightFoot.getOrigin());

  // ===== Step 2: Weight distribution and balance point =====
  LocomotionDecision decision;
  decision.distribution = classify(
    leftInBase, rightInBase, config_.footRadius, state.distribution);
  decision.balancePointInBase = balancePoint(leftInBase, rightInBase);
  decision.leftFoot = leftFoot;
  decision.rightFoot = rightFoot;

  // ===== Step 3: Foot targets =====
  switch (decision.distribution)
  {
    case WeightDistribution::RightPlanted:
    {
      Coordinate const reflected{-config_.stepMultiplier * rightInBase};
      decision.leftFoot = base.translated(reflected);
      decision.leftMoved = true;
      break;
    }
    case WeightDistribution::LeftPlanted:
    {
      Coordinate const reflected{-config_.stepMultiplier * leftInBase};
      decision.rightFoot = base.translated(reflected);
      decision.rightMoved = true;
      break;
    }
    case WeightDistribution::SharedWeight:
    {
      if (decision.balancePointInBase.norm() <= config_.staggerThreshold)
      {
        break;
      }

      // Stagger step: the foot nearer the balance point carries more load
      // and holds; the lighter one steps through the base origin
      double const leftLoad =
        (decision.balancePointInBase - leftInBase).squaredNorm();
      double const rightLoad =
        (decision.balancePointInBase - rightInBase).squaredNorm();
      bool const leftHeavy = leftLoad < rightLoad;

      Coordinate const& heavyInBase = leftHeavy ? leftInBase : rightInBase;
      Coordinate direction{0.0, 0.0, 0.0};
      if (heavyInBase.squaredNorm() > kDegenerateSegmentSquared)
      {
        direction = -heavyInBase.normalized();
      }
      Coordinate const stepTarget{heavyInBase + direction * config_.stepSize};

      if (leftHeavy)
      {
        decision.rightFoot = base.translated(stepTarget);
        decision.rightMoved = true;
      }
      else
      {
        decision.leftFoot = base.translated(stepTarget);
        decision.leftMoved = true;
      }
      break;
    }
  }

  // ===== Step 4: Persist =====
  state.distribution = decision.distribution;
  state.leftFoot = decision.leftFoot;
  state.rightFoot = decision.rightFoot;

  return decision;
}

}  // namespace xpbd_sim

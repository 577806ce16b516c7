// Ticket: 0003_gauss_seidel_solver

#include "xpbd-sim/src/Physics/Constraints/GaussSeidelSolver.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include <Eigen/Geometry>

namespace xpbd_sim
{

namespace
{

/// Small-angle quaternion update q <- normalize(q + sign * 0.5 (w, 0) q)
void rotateByHalfAxis(Eigen::Quaterniond& q,
                      const Eigen::Vector3d& axis,
                      double sign)
{
  Eigen::Quaterniond const spin{0.0, axis.x(), axis.y(), axis.z()};
  Eigen::Quaterniond const delta = spin * q;
  q.coeffs() += (sign * 0.5) * delta.coeffs();
  q.normalize();
}

}  // namespace

GaussSeidelSolver::GaussSeidelSolver() : GaussSeidelSolver{Config{}}
{
}

GaussSeidelSolver::GaussSeidelSolver(const Config& config) : config_{config}
{
  validate(config_);
}

void GaussSeidelSolver::setConfig(const Config& config)
{
  validate(config);
  config_ = config;
}

void GaussSeidelSolver::validate(const Config& config)
{
  if (config.iterations <= 0)
  {
    throw std::invalid_argument(
      "GaussSeidelSolver: iterations must be positive, got " +
      std::to_string(config.iterations));
  }
  if (!std::isfinite(config.degeneracyEpsilon) ||
      config.degeneracyEpsilon < 0.0)
  {
    throw std::invalid_argument(
      "GaussSeidelSolver: degeneracyEpsilon must be finite and non-negative");
  }
}

Eigen::Vector3d GaussSeidelSolver::leverArmWeight(const Coordinate& leverArm)
{
  double const x2 = leverArm.x() * leverArm.x();
  double const y2 = leverArm.y() * leverArm.y();
  double const z2 = leverArm.z() * leverArm.z();
  return Eigen::Vector3d{1.0 + y2 + z2, 1.0 + z2 + x2, 1.0 + x2 + y2};
}

GaussSeidelSolver::SolveResult GaussSeidelSolver::solve(
  SkeletonPose& pose,
  std::span<const DrivenNode> driven,
  const ConstraintSet& constraints) const
{
  SolveResult result;

  for (int iter = 0; iter < config_.iterations; ++iter)
  {
    // ===== Step 1: Re-seed driven nodes =====
    reseed(pose, driven);

    // ===== Step 2: Spherical constraints =====
    for (const auto& constraint : constraints.spherical)
    {
      if (!projectSpherical(pose, constraint))
      {
        ++result.skippedCorrections;
      }
    }

    // ===== Step 3: Distance constraints =====
    for (const auto& constraint : constraints.distance)
    {
      if (!projectDistance(pose, constraint))
      {
        ++result.skippedCorrections;
      }
    }

    ++result.iterations;
  }

  // The sweep moves driven nodes too; restore them so the output carries the
  // exact seeded transforms
  reseed(pose, driven);

  result.maxSphericalError = constraints.maxSphericalError(pose);
  result.maxDistanceError = constraints.maxDistanceError(pose);
  return result;
}

void GaussSeidelSolver::reseed(SkeletonPose& pose,
                               std::span<const DrivenNode> driven)
{
  for (const auto& node : driven)
  {
    pose.setTransform(node.landmark, node.frame);
  }
}

bool GaussSeidelSolver::projectSpherical(
  SkeletonPose& pose,
  const SphericalConstraint& constraint) const
{
  Coordinate const rA = constraint.leverArmA(pose);
  Coordinate const rB = constraint.leverArmB(pose);
  // Every weight component is >= 1, so the quotient is always defined
  Eigen::Vector3d const weightSum = leverArmWeight(rA) + leverArmWeight(rB);

  Coordinate const violation = constraint.evaluate(pose);
  Eigen::Vector3d const correction =
    -violation.cwiseQuotient(weightSum);

  if (!correction.allFinite())
  {
    return false;
  }

  applyCorrection(pose, constraint, rA, rB, correction);
  return true;
}

bool GaussSeidelSolver::projectDistance(
  SkeletonPose& pose,
  const DistanceConstraint& constraint) const
{
  Coordinate const rA = constraint.leverArmA(pose);
  Coordinate const rB = constraint.leverArmB(pose);
  Eigen::Vector3d const weightSum = leverArmWeight(rA) + leverArmWeight(rB);

  Coordinate const separation = (pose.position(constraint.nodeA()) + rA) -
                                (pose.position(constraint.nodeB()) + rB);
  double const length = separation.norm();

  // Direction is undefined for coincident attachment points
  if (length < config_.degeneracyEpsilon)
  {
    return false;
  }

  double const c = length - constraint.getRestDistance();
  Eigen::Vector3d const correction =
    (-c / length) * separation.cwiseQuotient(weightSum);

  if (!correction.allFinite())
  {
    return false;
  }

  applyCorrection(pose, constraint, rA, rB, correction);
  return true;
}

void GaussSeidelSolver::applyCorrection(SkeletonPose& pose,
                                        const NodeConstraint& constraint,
                                        const Coordinate& leverArmA,
                                        const Coordinate& leverArmB,
                                        const Eigen::Vector3d& correction)
{
  pose.position(constraint.nodeA()) += correction;
  pose.position(constraint.nodeB()) -= correction;

  rotateByHalfAxis(pose.orientation(constraint.nodeA()),
                   leverArmA.cross(correction),
                   1.0);
  rotateByHalfAxis(pose.orientation(constraint.nodeB()),
                   leverArmB.cross(correction),
                   -1.0);
}

}  // namespace xpbd_sim

// Ticket: 0003_gauss_seidel_solver

#ifndef XPBD_SIM_PHYSICS_GAUSS_SEIDEL_SOLVER_HPP
#define XPBD_SIM_PHYSICS_GAUSS_SEIDEL_SOLVER_HPP

#include <cstddef>
#include <span>

#include <Eigen/Dense>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"
#include "xpbd-sim/src/Physics/Constraints/ConstraintSet.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

namespace xpbd_sim
{

/// @brief A landmark whose transform is dictated by tracking or locomotion
struct DrivenNode
{
  Landmark landmark{Landmark::Hmd};
  ReferenceFrame frame;
};

/// @brief Sequential position-based projection of a skeleton constraint set
///
/// Projects each constraint in turn onto the current pose, immediately
/// applying its correction so the next constraint sees the updated state
/// (Gauss-Seidel). Every body is treated as unit mass with a diagonal,
/// lever-arm-dependent generalized weight:
///
///   w(r) = (1 + r.y^2 + r.z^2, 1 + r.z^2 + r.x^2, 1 + r.x^2 + r.y^2)
///
/// Algorithm (fixed iteration count, no early exit):
/// 1. Re-seed every driven node from its target frame
/// 2. Spherical constraints in declaration order:
///    dx = -C / (w_A + w_B), x_A += dx, x_B -= dx,
///    q_A <- normalize(q_A + 0.5 (r_A x dx, 0) q_A),
///    q_B <- normalize(q_B - 0.5 (r_B x dx, 0) q_B)
/// 3. Distance constraints in declaration order with
///    dx = (-C / ((w_A + w_B) |v|)) v, same update pattern
/// 4. After the last iteration driven nodes are re-seeded once more
///
/// Driven nodes are corrected like any other during the sweep; re-seeding is
/// what makes them effectively infinite-mass. Corrections that would divide by
/// a vanishing separation or weight are skipped and counted instead.
///
/// Thread safety: Stateless apart from configuration; solve() mutates only the
/// pose passed in.
class GaussSeidelSolver
{
public:
  /// @brief Configuration parameters for the projection loop
  struct Config
  {
    int iterations{10};              ///< Full sweeps per solve
    double degeneracyEpsilon{1e-9};  ///< Shortest separation a distance correction acts on [m]
  };

  /// @brief Diagnostics of one solve
  struct SolveResult
  {
    int iterations{0};              ///< Sweeps performed
    size_t skippedCorrections{0};   ///< Degenerate corrections not applied
    double maxSphericalError{0.0};  ///< Residual after the final re-seed [m]
    double maxDistanceError{0.0};   ///< Residual after the final re-seed [m]
  };

  GaussSeidelSolver();

  /// @throws std::invalid_argument if iterations <= 0 or the epsilon is
  /// negative or not finite
  explicit GaussSeidelSolver(const Config& config);

  ~GaussSeidelSolver() = default;

  /// @brief Project the constraint set onto the pose in place
  ///
  /// @param pose Warm-started node store, corrected in place
  /// @param driven Seed transforms re-applied before every sweep
  /// @param constraints Ordered constraint lists
  /// @return Iteration count, skipped corrections and residuals
  SolveResult solve(SkeletonPose& pose,
                    std::span<const DrivenNode> driven,
                    const ConstraintSet& constraints) const;

  /// @brief Per-axis generalized weight of a lever arm
  [[nodiscard]] static Eigen::Vector3d leverArmWeight(const Coordinate& leverArm);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  /// @throws std::invalid_argument under the same rules as the constructor
  void setConfig(const Config& config);

  GaussSeidelSolver(const GaussSeidelSolver&) = default;
  GaussSeidelSolver& operator=(const GaussSeidelSolver&) = default;
  GaussSeidelSolver(GaussSeidelSolver&&) noexcept = default;
  GaussSeidelSolver& operator=(GaussSeidelSolver&&) noexcept = default;

private:
  static void reseed(SkeletonPose& pose, std::span<const DrivenNode> driven);

  /// @return false if the correction was skipped as degenerate
  bool projectSpherical(SkeletonPose& pose,
                        const SphericalConstraint& constraint) const;

  /// @return false if the correction was skipped as degenerate
  bool projectDistance(SkeletonPose& pose,
                       const DistanceConstraint& constraint) const;

  /// Apply dx to both bodies and rotate them about their lever arms
  static void applyCorrection(SkeletonPose& pose,
                              const NodeConstraint& constraint,
                              const Coordinate& leverArmA,
                              const Coordinate& leverArmB,
                              const Eigen::Vector3d& correction);

  static void validate(const Config& config);

  Config config_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_GAUSS_SEIDEL_SOLVER_HPP

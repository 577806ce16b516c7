// Ticket: 0004_rig_tuning_parameters

#ifndef XPBD_SIM_RIG_TUNING_PARAMETERS_HPP
#define XPBD_SIM_RIG_TUNING_PARAMETERS_HPP

#include <span>
#include <string_view>

namespace xpbd_sim
{

/**
 * @brief Body dimensions, attachment offsets and solver tuning of the IK rig
 *
 * Named members carry the baked-in defaults. The same values are reachable
 * as a flat name -> scalar mapping through get()/set()/names() so an
 * external layer (console, config file, live-tuning UI) can hot-reload them
 * without knowing the struct layout.
 *
 * Offsets are in metres, expressed in the frame named by the parameter.
 * Lateral offsets describe the left side; the right side mirrors X.
 */
struct TuningParameters
{
  // Head and neck, offsets in the headset / head-center frame [m]
  double headCenterHeight{0.0};
  double headCenterDepth{0.10};
  double neckRootHeight{-0.10};
  double neckRootDepth{0.0};

  // Left wrist in the palm frame [m]
  double wristLateralOffset{-0.015};
  double wristVerticalOffset{-0.01};
  double wristDepthOffset{0.065};

  // Segment lengths and widths [m]
  double lowerArmLength{0.28};
  double upperArmLength{0.28};
  double collarboneLength{0.17};
  double sternumWidth{0.06};
  double hipWidth{0.26};

  // Joint heights in body frames [m]
  double sternumHeightInTorso{0.20};
  double neckRootHeightInTorso{0.22};
  double lowerBackHeightInTorso{-0.20};
  double lowerBackHeightInPelvis{0.10};
  double hipHeightInPelvis{-0.07};
  double upperLegLength{0.40};
  double lowerLegLength{0.40};
  double ankleHeight{0.10};

  // Locomotion
  double stanceHalfWidth{0.20};       ///< Default foot offset from base [m]
  double footRadius{0.1};             ///< Planted-foot capture radius [m]
  double stepMultiplier{3.0};         ///< Planted-step reflection gain
  double staggerThresholdScale{2.0};  ///< Stagger threshold in foot radii

  double solverIterations{10};  ///< Gauss-Seidel sweeps per tick (integral)

  /// Upper bound accepted for solver_iterations
  static constexpr double kMaxSolverIterations{10000.0};

  /**
   * @brief Look up a parameter by its external name
   * @throws std::out_of_range if the name is unknown
   */
  [[nodiscard]] double get(std::string_view name) const;

  /**
   * @brief Assign a parameter by its external name
   * @throws std::out_of_range if the name is unknown
   * @throws std::invalid_argument if the value is not finite, or
   *         solver_iterations is not an integer in [1, kMaxSolverIterations]
   */
  void set(std::string_view name, double value);

  /// @brief External names of every parameter, in declaration order
  [[nodiscard]] static std::span<const std::string_view> names();

  /// @brief Solver iteration count as an integer
  [[nodiscard]] int iterationCount() const;

  /// @brief Stagger threshold distance (footRadius * staggerThresholdScale) [m]
  [[nodiscard]] double staggerThreshold() const;

  /// @brief Stagger step length (footRadius * (stepMultiplier + 1)) [m]
  [[nodiscard]] double stepSize() const;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_TUNING_PARAMETERS_HPP

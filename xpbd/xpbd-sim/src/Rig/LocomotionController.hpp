// Ticket: 0008_locomotion_state_machine

#ifndef XPBD_SIM_RIG_LOCOMOTION_CONTROLLER_HPP
#define XPBD_SIM_RIG_LOCOMOTION_CONTROLLER_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"

namespace xpbd_sim
{

/// @brief Which foot currently carries the body
enum class WeightDistribution : uint8_t
{
  LeftPlanted,
  RightPlanted,
  SharedWeight,
};

std::string_view weightDistributionName(WeightDistribution distribution);

/**
 * @brief Balance state carried across ticks
 *
 * Foot targets are absent until the first tick has run; the driver resolver
 * substitutes default stance positions in that case.
 */
struct LocomotionState
{
  WeightDistribution distribution{WeightDistribution::SharedWeight};
  std::optional<ReferenceFrame> leftFoot;
  std::optional<ReferenceFrame> rightFoot;
};

/// @brief Outcome of one locomotion update
struct LocomotionDecision
{
  WeightDistribution distribution{WeightDistribution::SharedWeight};
  Coordinate balancePointInBase;  ///< Support-segment point nearest the base [m]
  ReferenceFrame leftFoot;        ///< Foot target for this tick (stage frame)
  ReferenceFrame rightFoot;       ///< Foot target for this tick (stage frame)
  bool leftMoved{false};          ///< Left target was re-placed this tick
  bool rightMoved{false};         ///< Right target was re-placed this tick
};

/**
 * @brief Procedural foot placement from the body's ground projection
 *
 * Feet are compared against the base frame (the body projected onto the
 * floor). A foot within footRadius of the base origin is "under" the body and
 * takes the weight; the other foot is then swung through to the mirrored
 * position scaled by stepMultiplier. With neither foot under the body the
 * weight is shared, and once the balance point leaves the staggerThreshold
 * disc the lighter foot takes a recovery step through the base origin.
 *
 * State transitions (near = strictly closer than footRadius):
 *
 *   both near      -> previous distribution (hysteresis)
 *   only left near -> LeftPlanted
 *   only right near-> RightPlanted
 *   neither near   -> SharedWeight
 *
 * Thread safety: Not thread-safe (mutates the LocomotionState passed in)
 */
class LocomotionController
{
public:
  struct Config
  {
    double footRadius{0.1};        ///< Planted-foot capture radius [m]
    double stepMultiplier{3.0};    ///< Planted-step reflection gain
    double staggerThreshold{0.2};  ///< Balance point distance for a stagger step [m]
    double stepSize{0.4};          ///< Stagger step length [m]
  };

  LocomotionController();

  /// @throws std::invalid_argument if any config value is negative or not
  /// finite
  explicit LocomotionController(const Config& config);

  /**
   * @brief Advance the balance state machine by one tick
   *
   * Classifies the weight distribution, chooses this tick's foot targets and
   * persists both targets and the distribution into @p state.
   *
   * @param state Cross-tick balance state (mutated)
   * @param base Current base frame in the stage
   * @param leftFoot Left foot input (previous target or default stance)
   * @param rightFoot Right foot input (previous target or default stance)
   */
  LocomotionDecision update(LocomotionState& state,
                            const ReferenceFrame& base,
                            const ReferenceFrame& leftFoot,
                            const ReferenceFrame& rightFoot) const;

  /**
   * @brief Weight distribution from foot positions in the base frame
   */
  [[nodiscard]] static WeightDistribution classify(
    const Coordinate& leftInBase,
    const Coordinate& rightInBase,
    double footRadius,
    WeightDistribution previous);

  /**
   * @brief Closest point to the base origin on the segment from a to b
   *
   * A degenerate segment returns @p a.
   */
  [[nodiscard]] static Coordinate balancePoint(const Coordinate& a,
                                               const Coordinate& b);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  void setConfig(const Config& config);

private:
  static void validate(const Config& config);

  static constexpr double kDegenerateSegmentSquared = 1e-12;

  Config config_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_LOCOMOTION_CONTROLLER_HPP

// Ticket: 0006_tracking_boundary

#ifndef XPBD_SIM_RIG_TRACKING_INPUT_HPP
#define XPBD_SIM_RIG_TRACKING_INPUT_HPP

#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"

namespace xpbd_sim
{

/**
 * @brief One sample of tracked device poses in the stage frame
 *
 * Grip frames locate the held controller; aim frames carry the pointing
 * orientation used for the palm.
 */
struct TrackingFrame
{
  ReferenceFrame hmd;
  ReferenceFrame leftGrip;
  ReferenceFrame leftAim;
  ReferenceFrame rightGrip;
  ReferenceFrame rightAim;
  bool menuButtonJustPressed{false};  ///< Edge-triggered snapshot request
};

/**
 * @brief Abstract source of tracking samples
 *
 * Implemented by the device layer (or a scripted source for playback and
 * tests). Called once per tick from the owning thread.
 */
class TrackingSource
{
public:
  virtual ~TrackingSource() = default;

  /// @brief Most recent tracked poses
  virtual TrackingFrame sample() = 0;

protected:
  TrackingSource() = default;
  TrackingSource(const TrackingSource&) = default;
  TrackingSource& operator=(const TrackingSource&) = default;
  TrackingSource(TrackingSource&&) noexcept = default;
  TrackingSource& operator=(TrackingSource&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_TRACKING_INPUT_HPP

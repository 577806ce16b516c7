// Ticket: 0006_tracking_boundary

#ifndef XPBD_SIM_RIG_POSE_SINK_HPP
#define XPBD_SIM_RIG_POSE_SINK_HPP

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Skeleton/Landmark.hpp"
#include "xpbd-sim/src/Skeleton/SkeletonPose.hpp"

namespace xpbd_sim
{

/**
 * @brief Receiver of solved landmark transforms
 *
 * Decouples the rig from the scene graph: the rig reports each landmark's
 * stage-space position and orientation, the sink decides which scene nodes
 * mirror it. Exceptions thrown from either callback are caught and logged by
 * the rig and never corrupt solver state.
 */
class PoseSink
{
public:
  virtual ~PoseSink() = default;

  /// @brief Write back one solved landmark transform
  virtual void applyNodeTransform(Landmark landmark,
                                  const Coordinate& position,
                                  const Eigen::Quaterniond& orientation) = 0;

  /**
   * @brief Called when the user requested a pose snapshot
   *
   * Persisting the snapshot (file, database, network) is up to the sink.
   * Default implementation ignores the request.
   */
  virtual void onSnapshotRequested(const SkeletonPose& /* pose */)
  {
  }

protected:
  PoseSink() = default;
  PoseSink(const PoseSink&) = default;
  PoseSink& operator=(const PoseSink&) = default;
  PoseSink(PoseSink&&) noexcept = default;
  PoseSink& operator=(PoseSink&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_POSE_SINK_HPP

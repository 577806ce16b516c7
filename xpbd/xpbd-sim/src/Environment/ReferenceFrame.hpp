#ifndef XPBD_SIM_REFERENCE_FRAME_HPP
#define XPBD_SIM_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"

namespace xpbd_sim
{

/**
 * @brief A rigid reference frame (translation + rotation) in a parent frame
 *
 * Represents the pose of a local frame relative to a parent (usually the
 * tracking stage). Rotation is stored as a unit quaternion; scale is never
 * represented. Frames compose like rigid transforms:
 *
 *   headCenterInStage = hmdInStage.compose(headCenterInHmd)
 *
 * maps a point expressed in the head-center frame all the way to the stage.
 *
 * Axis convention: Y-up, local -Z is "forward".
 */
class ReferenceFrame
{
public:
  /**
   * @brief Default constructor - creates identity frame at origin
   */
  ReferenceFrame();

  /**
   * @brief Constructor with translation only
   * @param origin The origin of this frame in parent coordinates
   */
  explicit ReferenceFrame(const Coordinate& origin);

  /**
   * @brief Constructor with translation and rotation
   * @param origin The origin of this frame in parent coordinates
   * @param orientation Rotation from local to parent (normalized on entry)
   */
  ReferenceFrame(const Coordinate& origin,
                 const Eigen::Quaterniond& orientation);

  /**
   * @brief Transform a point from the parent frame to this local frame
   * @param globalPoint Point in parent frame
   * @return Point in this local frame
   */
  [[nodiscard]] Coordinate globalToLocal(const Coordinate& globalPoint) const;

  /**
   * @brief Transform a point from this local frame to the parent frame
   * @param localPoint Point in this local frame
   * @return Point in parent frame
   */
  [[nodiscard]] Coordinate localToGlobal(const Coordinate& localPoint) const;

  /**
   * @brief Rotate a direction vector from the parent frame to this frame
   *
   * Applies only rotation, not translation.
   */
  [[nodiscard]] Coordinate globalToLocalRelative(
    const Coordinate& globalVector) const;

  /**
   * @brief Rotate a direction vector from this frame to the parent frame
   *
   * Applies only rotation, not translation.
   */
  [[nodiscard]] Coordinate localToGlobalRelative(
    const Coordinate& localVector) const;

  /**
   * @brief Compose this frame with a frame expressed in it
   *
   * @param local Frame expressed in this frame's coordinates
   * @return The same frame expressed in this frame's parent
   */
  [[nodiscard]] ReferenceFrame compose(const ReferenceFrame& local) const;

  /**
   * @brief Compose with a pure translation expressed in this frame
   */
  [[nodiscard]] ReferenceFrame translated(const Coordinate& localOffset) const;

  /**
   * @brief Inverse transform (parent expressed in this frame)
   */
  [[nodiscard]] ReferenceFrame inverse() const;

  /**
   * @brief Express another frame (given in the same parent) in this frame
   *
   * Equivalent to inverse().compose(other).
   */
  [[nodiscard]] ReferenceFrame relative(const ReferenceFrame& other) const;

  /// @name Local axes expressed in the parent frame
  /// @{
  [[nodiscard]] Coordinate xAxis() const;
  [[nodiscard]] Coordinate yAxis() const;
  [[nodiscard]] Coordinate zAxis() const;
  /// @}

  void setOrigin(const Coordinate& origin);

  /**
   * @brief Set the rotation, renormalizing the quaternion
   */
  void setOrientation(const Eigen::Quaterniond& orientation);

  [[nodiscard]] const Coordinate& getOrigin() const
  {
    return origin_;
  }

  [[nodiscard]] const Eigen::Quaterniond& getOrientation() const
  {
    return orientation_;
  }

  /**
   * @brief Get the rotation matrix (columns are the local axes)
   */
  [[nodiscard]] Eigen::Matrix3d getRotation() const
  {
    return orientation_.toRotationMatrix();
  }

private:
  Coordinate origin_;               ///< Origin of this frame in parent coordinates
  Eigen::Quaterniond orientation_;  ///< Rotation from local to parent
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_REFERENCE_FRAME_HPP

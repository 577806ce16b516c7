#include "xpbd-sim/src/Environment/ReferenceFrame.hpp"

namespace xpbd_sim
{

ReferenceFrame::ReferenceFrame()
  : origin_{0.0, 0.0, 0.0}, orientation_{Eigen::Quaterniond::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin)
  : origin_{origin}, orientation_{Eigen::Quaterniond::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Quaterniond& orientation)
  : origin_{origin}, orientation_{orientation.normalized()}
{
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& globalPoint) const
{
  // Translate to frame origin, then rotate to local orientation
  Coordinate const translated = globalPoint - origin_;
  return orientation_.conjugate() * translated;
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& localPoint) const
{
  // Rotate to parent orientation, then translate to parent position
  Coordinate const rotated = orientation_ * localPoint;
  return rotated + origin_;
}

Coordinate ReferenceFrame::globalToLocalRelative(
  const Coordinate& globalVector) const
{
  return orientation_.conjugate() * globalVector;
}

Coordinate ReferenceFrame::localToGlobalRelative(
  const Coordinate& localVector) const
{
  return orientation_ * localVector;
}

ReferenceFrame ReferenceFrame::compose(const ReferenceFrame& local) const
{
  return ReferenceFrame{localToGlobal(local.origin_),
                        orientation_ * local.orientation_};
}

ReferenceFrame ReferenceFrame::translated(const Coordinate& localOffset) const
{
  return ReferenceFrame{localToGlobal(localOffset), orientation_};
}

ReferenceFrame ReferenceFrame::inverse() const
{
  Eigen::Quaterniond const inv = orientation_.conjugate();
  Coordinate const negatedOrigin{-origin_};
  return ReferenceFrame{inv * negatedOrigin, inv};
}

ReferenceFrame ReferenceFrame::relative(const ReferenceFrame& other) const
{
  return ReferenceFrame{globalToLocal(other.origin_),
                        orientation_.conjugate() * other.orientation_};
}

Coordinate ReferenceFrame::xAxis() const
{
  return orientation_ * Coordinate{1.0, 0.0, 0.0};
}

Coordinate ReferenceFrame::yAxis() const
{
  return orientation_ * Coordinate{0.0, 1.0, 0.0};
}

Coordinate ReferenceFrame::zAxis() const
{
  return orientation_ * Coordinate{0.0, 0.0, 1.0};
}

void ReferenceFrame::setOrigin(const Coordinate& origin)
{
  origin_ = origin;
}

void ReferenceFrame::setOrientation(const Eigen::Quaterniond& orientation)
{
  orientation_ = orientation.normalized();
}

}  // namespace xpbd_sim

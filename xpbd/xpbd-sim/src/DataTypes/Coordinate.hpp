#ifndef XPBD_SIM_COORDINATE_HPP
#define XPBD_SIM_COORDINATE_HPP

#include "xpbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "xpbd-sim/src/DataTypes/Vec3Formatter.hpp"

namespace xpbd_sim
{

/**
 * @brief Position or offset vector [m]
 *
 * Used for world positions, attachment offsets in a body frame and
 * predicted particle positions alike.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace xpbd_sim

template <>
struct std::formatter<xpbd_sim::Coordinate>
  : xpbd_sim::detail::Vec3Formatter<xpbd_sim::Coordinate>
{
};

#endif  // XPBD_SIM_COORDINATE_HPP

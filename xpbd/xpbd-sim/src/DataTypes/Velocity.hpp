#ifndef XPBD_SIM_VELOCITY_HPP
#define XPBD_SIM_VELOCITY_HPP

#include "xpbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "xpbd-sim/src/DataTypes/Vec3Formatter.hpp"

namespace xpbd_sim
{

/**
 * @brief Linear velocity vector [m/s]
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Velocity final : detail::Vec3DBase<Velocity>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Velocity(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace xpbd_sim

template <>
struct std::formatter<xpbd_sim::Velocity>
  : xpbd_sim::detail::Vec3Formatter<xpbd_sim::Velocity>
{
};

#endif  // XPBD_SIM_VELOCITY_HPP

#ifndef XPBD_SIM_ACCELERATION_HPP
#define XPBD_SIM_ACCELERATION_HPP

#include "xpbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "xpbd-sim/src/DataTypes/Vec3Formatter.hpp"

namespace xpbd_sim
{

/**
 * @brief Linear acceleration vector [m/s^2]
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Acceleration final : detail::Vec3DBase<Acceleration>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Acceleration(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace xpbd_sim

template <>
struct std::formatter<xpbd_sim::Acceleration>
  : xpbd_sim::detail::Vec3Formatter<xpbd_sim::Acceleration>
{
};

#endif  // XPBD_SIM_ACCELERATION_HPP

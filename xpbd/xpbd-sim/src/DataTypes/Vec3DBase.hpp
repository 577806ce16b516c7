// Ticket: 0001_skeleton_node_store

#ifndef XPBD_SIM_VEC3D_BASE_HPP
#define XPBD_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace xpbd_sim::detail
{

/**
 * @brief Shared storage for the semantic vector types
 *
 * Coordinate, Velocity and Acceleration are all an Eigen::Vector3d
 * underneath, so substep arithmetic like `x + v * dt` stays a plain Eigen
 * expression. Each derived type re-exposes the expression constructor so the
 * result lands back in the type named at the call site.
 *
 * @tparam Derived The semantic vector type
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{Eigen::Vector3d::Zero()}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& expr)
    : Eigen::Vector3d{expr}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& expr)
  {
    Eigen::Vector3d::operator=(expr);
    return static_cast<Derived&>(*this);
  }

  /// @brief Projection onto the ground plane (world frame is Y-up)
  [[nodiscard]] Derived horizontal() const
  {
    Derived projected{static_cast<const Derived&>(*this)};
    projected.y() = 0.0;
    return projected;
  }
};

}  // namespace xpbd_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // XPBD_SIM_VEC3D_BASE_HPP

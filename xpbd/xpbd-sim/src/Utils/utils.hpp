#ifndef XPBD_SIM_UTILS_HPP
#define XPBD_SIM_UTILS_HPP

#include <Eigen/Geometry>
#include <cmath>

namespace xpbd_sim
{

inline bool almostEqual(double a, double b, double tolerance)
{
  return std::abs(a - b) < tolerance;
}

/// @brief Deviation of a quaternion from the unit-norm manifold, | |q| - 1 |
inline double unitNormError(const Eigen::Quaterniond& q)
{
  return std::abs(q.norm() - 1.0);
}

}  // namespace xpbd_sim

#endif  // XPBD_SIM_UTILS_HPP

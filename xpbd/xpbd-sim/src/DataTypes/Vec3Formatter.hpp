// Ticket: 0001_skeleton_node_store

#ifndef XPBD_SIM_VEC3_FORMATTER_HPP
#define XPBD_SIM_VEC3_FORMATTER_HPP

#include <Eigen/Dense>
#include <format>

namespace xpbd_sim::detail
{

/// Formatter shared by the 3-component vector types.
/// The format spec applies to each component, so "{:.3f}" on a Coordinate
/// yields "(x, y, z)" with three decimals each.
template <typename T>
struct Vec3Formatter
{
  std::formatter<double> component;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    return component.parse(ctx);
  }

  auto format(const T& vec, std::format_context& ctx) const
  {
    auto out = ctx.out();
    *out++ = '(';
    for (Eigen::Index i = 0; i < 3; ++i)
    {
      if (i > 0)
      {
        out = std::format_to(out, ", ");
      }
      ctx.advance_to(out);
      out = component.format(vec(i), ctx);
    }
    *out++ = ')';
    return out;
  }
};

}  // namespace xpbd_sim::detail

#endif  // XPBD_SIM_VEC3_FORMATTER_HPP

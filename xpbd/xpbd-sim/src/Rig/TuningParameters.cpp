// Ticket: 0004_rig_tuning_parameters

#include "xpbd-sim/src/Rig/TuningParameters.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>

namespace xpbd_sim
{

namespace
{

struct ParameterEntry
{
  std::string_view name;
  double TuningParameters::*member;
};

constexpr std::array kParameterTable{
  ParameterEntry{"head_center_height", &TuningParameters::headCenterHeight},
  ParameterEntry{"head_center_depth", &TuningParameters::headCenterDepth},
  ParameterEntry{"neck_root_height", &TuningParameters::neckRootHeight},
  ParameterEntry{"neck_root_depth", &TuningParameters::neckRootDepth},
  ParameterEntry{"wrist_lateral_offset", &TuningParameters::wristLateralOffset},
  ParameterEntry{"wrist_vertical_offset",
                 &TuningParameters::wristVerticalOffset},
  ParameterEntry{"wrist_depth_offset", &TuningParameters::wristDepthOffset},
  ParameterEntry{"lower_arm_length", &TuningParameters::lowerArmLength},
  ParameterEntry{"upper_arm_length", &TuningParameters::upperArmLength},
  ParameterEntry{"collarbone_length", &TuningParameters::collarboneLength},
  ParameterEntry{"sternum_width", &TuningParameters::sternumWidth},
  ParameterEntry{"hip_width", &TuningParameters::hipWidth},
  ParameterEntry{"sternum_height_in_torso",
                 &TuningParameters::sternumHeightInTorso},
  ParameterEntry{"neck_root_height_in_torso",
                 &TuningParameters::neckRootHeightInTorso},
  ParameterEntry{"lower_back_height_in_torso",
                 &TuningParameters::lowerBackHeightInTorso},
  ParameterEntry{"lower_back_height_in_pelvis",
                 &TuningParameters::lowerBackHeightInPelvis},
  ParameterEntry{"hip_height_in_pelvis", &TuningParameters::hipHeightInPelvis},
  ParameterEntry{"upper_leg_length", &TuningParameters::upperLegLength},
  ParameterEntry{"lower_leg_length", &TuningParameters::lowerLegLength},
  ParameterEntry{"ankle_height", &TuningParameters::ankleHeight},
  ParameterEntry{"stance_half_width", &TuningParameters::stanceHalfWidth},
  ParameterEntry{"foot_radius", &TuningParameters::footRadius},
  ParameterEntry{"step_multiplier", &TuningParameters::stepMultiplier},
  ParameterEntry{"stagger_threshold_scale",
                 &TuningParameters::staggerThresholdScale},
  ParameterEntry{"solver_iterations", &TuningParameters::solverIterations},
};

constexpr auto kParameterNames = []()
{
  std::array<std::string_view, kParameterTable.size()> names{};
  for (size_t i = 0; i < kParameterTable.size(); ++i)
  {
    names[i] = kParameterTable[i].name;
  }
  return names;
}();

const ParameterEntry& findEntry(std::string_view name)
{
  auto const it = std::find_if(kParameterTable.begin(),
                                kParameterTable.end(),
                                [name](const ParameterEntry& entry)
                                { return entry.name == name; });
  if (it == kParameterTable.end())
  {
    throw std::out_of_range(
      std::format("TuningParameters: unknown parameter '{}'", name));
  }
  return *it;
}

}  // namespace

double TuningParameters::get(std::string_view name) const
{
  return this->*(findEntry(name).member);
}

void TuningParameters::set(std::string_view name, double value)
{
  const auto& entry = findEntry(name);

  if (!std::isfinite(value))
  {
    throw std::invalid_argument(
      std::format("TuningParameters: value for '{}' must be finite", name));
  }
  if (entry.member == &TuningParameters::solverIterations &&
      (value < 1.0 || value > kMaxSolverIterations ||
       std::floor(value) != value))
  {
    throw std::invalid_argument(std::format(
      "TuningParameters: solver_iterations must be an integer in [1, {}], "
      "got {}",
      kMaxSolverIterations,
      value));
  }

  this->*(entry.member) = value;
}

std::span<const std::string_view> TuningParameters::names()
{
  return kParameterNames;
}

int TuningParameters::iterationCount() const
{
  return static_cast<int>(std::lround(solverIterations));
}

double TuningParameters::staggerThreshold() const
{
  return footRadius * staggerThresholdScale;
}

double TuningParameters::stepSize() const
{
  return footRadius * (stepMultiplier + 1.0);
}

}  // namespace xpbd_sim

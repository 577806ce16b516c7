// Ticket: 0005_humanoid_anatomy

#ifndef XPBD_SIM_RIG_HUMANOID_CONSTRAINT_FACTORY_HPP
#define XPBD_SIM_RIG_HUMANOID_CONSTRAINT_FACTORY_HPP

#include "xpbd-sim/src/Physics/Constraints/ConstraintSet.hpp"
#include "xpbd-sim/src/Rig/TuningParameters.hpp"

namespace xpbd_sim
{

/**
 * @brief Builds the joint constraints of the humanoid skeleton
 *
 * Spherical joints, in solve order: wrists, elbows, neck, lower back, hips,
 * knees, ankles (left before right within each pair). Distance constraints:
 * left and right collarbone linking each upper arm to the sternum.
 *
 * Limb segments are modelled with their origin at the segment midpoint: arms
 * run along local Z, legs along local Y.
 */
class HumanoidConstraintFactory
{
public:
  [[nodiscard]] static ConstraintSet build(const TuningParameters& params);
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_RIG_HUMANOID_CONSTRAINT_FACTORY_HPP

#pragma once
#include <string>

namespace orckit::thermophysics {

/**
 * @brief Parameters of an incompressible liquid (thermal oils, brines)
 *
 * cp, density and conductivity are linear in (T - T_ref); viscosity follows an Andrade law.
 */
struct IncompressibleFluidParameters {
  std::string name;
  double reference_temperature = 273.15;
  double cp_reference = 0.0;
  double cp_slope = 0.0;
  double density_reference = 0.0;
  double density_slope = 0.0;
  double conductivity_reference = 0.0;
  double conductivity_slope = 0.0;
  double viscosity_reference = 0.0;
  double viscosity_activation = 0.0;
  double min_temperature = 0.0;
  double max_temperature = 0.0;
};

} // namespace orckit::thermophysics

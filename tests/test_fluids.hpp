#pragma once
#include "orckit/thermophysics/fluid_library.hpp"
#include <gtest/gtest.h>

namespace orckit::test_support {

// Heat transfer oil used on the hot side of the exchanger cases
inline auto thermal_oil() -> thermophysics::IncompressibleFluidParameters {
  thermophysics::IncompressibleFluidParameters oil;
  oil.name = "PiroblocBasic";
  oil.reference_temperature = 273.15;
  oil.cp_reference = 1800.0;
  oil.cp_slope = 3.6;
  oil.density_reference = 885.0;
  oil.density_slope = -0.65;
  oil.conductivity_reference = 0.135;
  oil.conductivity_slope = -7.0e-5;
  oil.viscosity_reference = 0.103;
  oil.viscosity_activation = 10.6;
  oil.min_temperature = 253.15;
  oil.max_temperature = 593.15;
  return oil;
}

inline auto fluids_with_thermal_oil() -> io::FluidsConfig {
  io::FluidsConfig config;
  config.incompressible.push_back(thermal_oil());
  return config;
}

} // namespace orckit::test_support

#pragma once
#include "../expander/expander_config.hpp"
#include "../hex/hex_config.hpp"
#include "../thermophysics/fluid_parameters.hpp"
#include "../thermophysics/stream.hpp"
#include <optional>
#include <string>
#include <vector>

namespace orckit::io {

// Thermal oils declared next to the CoolProp fluids, matched by name
struct FluidsConfig {
  std::vector<thermophysics::IncompressibleFluidParameters> incompressible;
};

struct HexCaseConfig {
  thermophysics::Stream hot;
  thermophysics::Stream cold;
  hex::HexConfig exchanger;
};

struct ExpanderCaseConfig {
  thermophysics::Stream supply;
  double exhaust_pressure = 0.0;      // [Pa]
  double ambient_temperature = 293.15; // [K]
  expander::ExpanderConfig machine;
};

struct OutputConfig {
  std::string output_directory = "orckit_outputs";
  std::string case_name = "case";
  bool write_hdf5 = true;
};

struct Configuration {
  FluidsConfig fluids;
  std::optional<HexCaseConfig> heat_exchanger;
  std::optional<ExpanderCaseConfig> expander;
  OutputConfig output;
  bool verbose = false;
};

} // namespace orckit::io

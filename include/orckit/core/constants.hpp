#pragma once

#include <cstddef>

namespace orckit::constants {

// ================================================================================================
// FUNDAMENTAL PHYSICAL CONSTANTS
// ================================================================================================

namespace physical {
/// Universal gas constant [J/(mol·K)]
inline constexpr double universal_gas_constant = 8.31446261815324;

/// Standard gravitational acceleration [m/s²]
inline constexpr double gravity = 9.81;

/// Mathematical constant π
inline constexpr double pi = 3.14159265358979323846;

/// Zero Celsius [K]
inline constexpr double zero_celsius = 273.15;
}  // namespace physical

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Relative step tolerance of the duty searches
inline constexpr double duty_relative = 1e-6;

/// Absolute step tolerance of the duty searches [W]
inline constexpr double duty_absolute = 1e-6;

/// Absolute step tolerance of the variable coefficient duty search [W]
inline constexpr double duty_absolute_fine = 1e-8;

/// Property inversion tolerance (relative)
inline constexpr double property_inversion = 1e-10;

/// Wall temperature residual tolerance
inline constexpr double wall_energy_balance = 1e-4;

/// Rotational speed residual tolerance
inline constexpr double speed_residual = 1e-5;
}  // namespace tolerance

// ================================================================================================
// ITERATION LIMITS
// ================================================================================================

namespace iteration_limits {
/// Maximum iterations of the Brent root finder
inline constexpr int root_finder_max = 200;

/// Maximum iterations of the boiling number closure
inline constexpr int boiling_number_max = 10;
}  // namespace iteration_limits

// ================================================================================================
// HEAT EXCHANGER THRESHOLDS
// ================================================================================================

namespace hex {
/// Minimum supply temperature difference for a non-trivial solve [K]
inline constexpr double min_supply_temperature_difference = 1e-2;

/// Floor on zone end temperature differences used in the log-mean [K]
inline constexpr double min_end_temperature_difference = 1e-2;

/// Pinch at maximum duty below which the profile is considered touching [K]
inline constexpr double zero_pinch_tolerance = 1e-2;

/// Area residual accepted as converged
inline constexpr double area_residual_tolerance = 1e-4;

/// Relative pinch residual accepted as converged
inline constexpr double pinch_residual_tolerance = 1e-4;

/// Relative change of the boiling number accepted by the closure loop
inline constexpr double boiling_number_tolerance = 5e-2;

/// Lower clamp of the polynomial effectiveness
inline constexpr double min_polynomial_effectiveness = 1e-5;

/// Upper clamp of the integrated quality in two-phase mass inventory
inline constexpr double max_integrated_quality = 0.9999;

/// Lower duty bound of the correlation-based area matching [W]
inline constexpr double correlation_min_duty = 1.0;

/// Default number of sub-zones per two-phase zone
inline constexpr int default_two_phase_subdivisions = 2;
}  // namespace hex

// ================================================================================================
// EXPANDER DEFAULTS
// ================================================================================================

namespace expander {
/// Pressure of the default lower enthalpy bound [Pa]
inline constexpr double h_min_pressure = 5e4;

/// Temperature of the default lower enthalpy bound [K]
inline constexpr double h_min_temperature = 253.15;

/// Pressure of the default upper enthalpy bound [Pa]
inline constexpr double h_max_pressure = 4e6;

/// Temperature of the default upper enthalpy bound [K]
inline constexpr double h_max_temperature = 500.0;

/// Default supply port diameter [m]
inline constexpr double default_supply_diameter = 1e2;

/// Exponent of the mass-flow scaling of the heat transfer conductances
inline constexpr double conductance_flow_exponent = 0.8;

/// Weight of the supply temperature in the initial wall temperature guess
inline constexpr double wall_guess_supply_weight = 0.85;

/// Smallest wall temperature tried by the wall temperature search [K]
inline constexpr double min_wall_temperature = 1.0;

/// Filling factor clamp used inside the speed residual
inline constexpr double min_filling_factor = 0.2;
inline constexpr double max_filling_factor_residual = 5.0;

/// Filling factor clamp applied to the final value
inline constexpr double max_filling_factor = 10.0;

/// Isentropic efficiency clamp
inline constexpr double min_isentropic_efficiency = 0.01;
inline constexpr double max_isentropic_efficiency = 1.0;

/// Quality used to bound the supply state after heat pickup
inline constexpr double supply_quality_floor = 0.1;

/// Relative density step of the symmetric pressure inversion fallback
inline constexpr double density_perturbation = 1e-3;
}  // namespace expander

} // namespace orckit::constants

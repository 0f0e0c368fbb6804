#pragma once
#include "../core/exceptions.hpp"
#include <array>
#include <limits>
#include <optional>
#include <string>

namespace orckit::expander {

class ExpanderSolverError : public core::OrckitException {
public:
  explicit ExpanderSolverError(std::string_view message,
                               std::source_location location = std::source_location::current())
      : OrckitException(std::format("Expander Error: {}", message), location) {}
};

enum class ExpanderFlag : int { Converged = 1, NotConverged = -1, NonPositivePressureRatio = -2 };

inline constexpr double nan = std::numeric_limits<double>::quiet_NaN();

// One state of the internal chain; entropy and density are NaN where undefined
struct ThermoState {
  double pressure = nan; // [Pa]
  double enthalpy = nan; // [J/kg]
  double entropy = nan;  // [J/(kg·K)]
  double density = nan;  // [kg/m³]
};

/**
 * @brief Internal states and energy flows of the semi-empirical model at one wall temperature
 *
 * su1: after the supply pressure drop, su2: after supply heat pickup, in: end of the
 * built-in volume ratio expansion, ex2: after the constant-volume expansion to the exhaust
 * pressure, ex1: after mixing with the leakage, ex: after exhaust heat exchange.
 */
struct InternalStates {
  ThermoState su1;
  ThermoState su2;
  ThermoState in;
  ThermoState ex2;
  ThermoState ex1;
  ThermoState ex;

  double T_su1 = nan;
  double T_ex1 = nan;
  double gamma = nan;
  double throat_pressure = nan;
  double leakage_flow = 0.0;  // [kg/s]
  double internal_flow = 0.0; // [kg/s]
  double speed = 0.0;         // [rpm]
  double supply_heat = 0.0;   // [W]
  double exhaust_heat = 0.0;  // [W]
  double ambient_loss = 0.0;  // [W]
  double internal_power = 0.0;
  double loss_power = 0.0;
  double power = 0.0;
  double residual = nan; // normalized wall energy balance
};

struct ExpanderResult {
  ExpanderFlag flag = ExpanderFlag::NotConverged;
  std::string model;

  double T_su = nan;
  double h_su = nan;
  double h_ex_s = nan; // isentropic exhaust enthalpy
  double T_ex = nan;
  double h_ex = nan;

  double power = 0.0;            // W_dot [W]
  double isentropic_power = 0.0; // [W]
  double isentropic_efficiency = 1.0;
  double filling_factor = 1.0;
  double speed = 0.0;        // N_exp [rpm]
  double ambient_loss = 0.0; // [W]
  double mass = 0.0;         // retained mass [kg]
  double wall_temperature = nan;
  double residual = nan;
  int iterations = 0;

  std::optional<InternalStates> internal;

  // Two-point T-s diagram, supply then exhaust
  std::array<double, 2> ts_temperature{nan, nan};
  std::array<double, 2> ts_entropy{nan, nan};

  [[nodiscard]] auto flag_value() const noexcept -> int { return static_cast<int>(flag); }
};

} // namespace orckit::expander

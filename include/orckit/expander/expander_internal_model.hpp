#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "expander_config.hpp"
#include "expander_types.hpp"
#include <expected>
#include <string>

namespace orckit::expander {

// Operating point shared by every wall temperature evaluation
struct ExpanderInlet {
  std::string fluid;
  double P_su = 0.0;
  double h_su = 0.0;
  double T_su = 0.0;
  double s_su = 0.0;
  double rho_su = 0.0;
  double mass_flow = 0.0;
  double P_ex = 0.0;
  double h_ex_s = 0.0;
  double T_amb = 0.0;
  double h_min = 0.0; // exhaust enthalpy validity bounds
  double h_max = 0.0;
};

/**
 * @brief Semi-empirical volumetric expander at a trial wall temperature
 *
 * Chains supply pressure drop, supply heat pickup, leakage through a throttled nozzle,
 * built-in volume ratio expansion, constant-volume expansion, mechanical losses, leakage
 * remixing, exhaust heat exchange and ambient loss. The returned residual is the normalized
 * wall energy balance (Q_su + W_loss - Q_ex - Q_amb) / (Q_su + W_loss), signed, with the
 * raw numerator used when the normalizer is not positive.
 */
class ExpanderInternalModel {
private:
  const thermophysics::PropertyOracle& oracle_;
  ExpanderInlet inlet_;
  SemiEmpiricalModel model_;
  double swept_volume_;

  [[nodiscard]] auto property(thermophysics::Property output, thermophysics::Property input1, double value1,
                              thermophysics::Property input2, double value2) const
      -> std::expected<double, ExpanderSolverError>;

  // Specific heat at (P, h), saturated liquid value inside the dome
  [[nodiscard]] auto specific_heat(double pressure, double enthalpy) const
      -> std::expected<double, ExpanderSolverError>;

  [[nodiscard]] auto heat_capacity_ratio(double pressure, double enthalpy) const
      -> std::expected<double, ExpanderSolverError>;

  // Pressure at (rho, s) with a symmetric density perturbation when the direct inversion fails
  [[nodiscard]] auto pressure_from_density_entropy(double density, double entropy) const
      -> std::expected<double, ExpanderSolverError>;

public:
  ExpanderInternalModel(const thermophysics::PropertyOracle& oracle, ExpanderInlet inlet, SemiEmpiricalModel model,
                        double swept_volume);

  [[nodiscard]] auto evaluate(double wall_temperature) const -> std::expected<InternalStates, ExpanderSolverError>;

  // Initial wall temperature guess 0.85 T_su + 0.15 T_amb
  [[nodiscard]] auto wall_temperature_guess() const noexcept -> double;

  // Fills entropy and density of the chain states, NaN where the fluid does not define them
  void describe(InternalStates& states) const;
};

} // namespace orckit::expander

#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include <optional>
#include <string_view>
#include <variant>

namespace orckit::expander {

/**
 * @brief Bivariate polynomial gamma = sum c(i, j) x^i y^j
 *
 * A 1x1 matrix is a constant heat capacity ratio.
 */
class GammaRegression {
private:
  core::PolynomialCoefficients coefficients_;

public:
  GammaRegression();
  explicit GammaRegression(core::PolynomialCoefficients coefficients);

  [[nodiscard]] auto evaluate(double x, double y) const -> double;
  [[nodiscard]] auto coefficients() const noexcept -> const core::PolynomialCoefficients& { return coefficients_; }
};

// Heat capacity ratio used to locate the critical throat pressure of the leakage path
struct GammaModel {
  GammaRegression superheated; // x = P/1e5 [bar], y = T/1e2 [hK]
  GammaRegression two_phase;   // x = P/1e5 [bar], y = quality
};

struct ConstantEfficiencyModel {
  double isentropic_efficiency = 0.7;
  double filling_factor = 1.0;
  double ambient_conductance = 0.0; // AU_amb [W/K]
};

/**
 * @brief Efficiency and filling factor regressions in (rp, rho_su), optionally with speed terms
 *
 * Features: [1, rp, rho, rp², rp·rho, rho²] for 6 coefficients, extended by
 * [N, N², N·rp, N·rho] for 10 coefficients.
 */
struct PolynomialEfficiencyModel {
  core::RegressionCoefficients efficiency_coefficients;
  core::RegressionCoefficients filling_factor_coefficients;
  double ambient_conductance = 0.0;
};

struct SemiEmpiricalModel {
  double built_in_volume_ratio = 1.0;    // r_v_in [-]
  double leakage_area = 0.0;             // A_leak [m²]
  double supply_diameter = constants::expander::default_supply_diameter; // d_su [m]
  double proportional_loss = 0.0;        // alpha [-]
  double constant_loss = 0.0;            // W_dot_loss_0 [W]
  double loss_torque = 0.0;              // C_loss [N·m]
  double supply_conductance = 0.0;       // AU_su_n [W/K]
  double exhaust_conductance = 0.0;      // AU_ex_n [W/K]
  double ambient_conductance = 0.0;      // AU_amb [W/K]
  double nominal_mass_flow = 1.0;        // M_dot_n [kg/s]
  GammaModel gamma;
};

using ExpanderModel = std::variant<ConstantEfficiencyModel, PolynomialEfficiencyModel, SemiEmpiricalModel>;

[[nodiscard]] auto model_name(const ExpanderModel& model) noexcept -> std::string_view;

struct ExpanderConfig {
  ExpanderModel model = ConstantEfficiencyModel{};
  double swept_volume = 0.0;    // V_s [m³]
  double internal_volume = 0.0; // V [m³]

  // Exhaust enthalpy validity bounds, resolved from the fluid when absent
  std::optional<double> h_min;
  std::optional<double> h_max;
};

} // namespace orckit::expander

#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "../thermophysics/stream.hpp"
#include "expander_config.hpp"
#include "expander_internal_model.hpp"
#include "expander_types.hpp"
#include <expected>

namespace orckit::expander {

/**
 * @brief Steady-state volumetric expander solver
 *
 * CstEff applies a given isentropic efficiency and filling factor. PolEff evaluates the
 * efficiency and filling factor regressions, solving for the rotational speed when the filling
 * factor depends on it. SemiEmp solves the wall temperature closing the internal energy balance.
 * A pressure ratio not above one, a non-positive exhaust pressure or a non-positive mass flow
 * short-circuits to the isentropic fallback with flag -2 before any exhaust state is queried.
 */
class ExpanderSolver {
private:
  const thermophysics::PropertyOracle& oracle_;
  ExpanderConfig config_;

  struct ModelOutcome {
    ExpanderFlag flag = ExpanderFlag::NotConverged;
    double h_ex = nan;
    double power = 0.0;
    double efficiency = 1.0;
    double filling_factor = 1.0;
    double speed = 0.0;
    double ambient_loss = 0.0;
    double wall_temperature = nan;
    double residual = nan;
    int iterations = 0;
    std::optional<InternalStates> internal;
  };

  [[nodiscard]] auto solve_constant_efficiency(const ConstantEfficiencyModel& model, const ExpanderInlet& inlet) const
      -> ModelOutcome;

  [[nodiscard]] auto solve_polynomial_efficiency(const PolynomialEfficiencyModel& model,
                                                 const ExpanderInlet& inlet) const
      -> std::expected<ModelOutcome, ExpanderSolverError>;

  [[nodiscard]] auto solve_semi_empirical(const SemiEmpiricalModel& model, const ExpanderInlet& inlet) const
      -> std::expected<ModelOutcome, ExpanderSolverError>;

  // Supply-side state only: valid whatever the exhaust pressure
  [[nodiscard]] auto resolve_inlet(const thermophysics::Stream& supply, double P_ex, double T_amb) const
      -> std::expected<ExpanderInlet, ExpanderSolverError>;

  // Isentropic exhaust enthalpy and exhaust enthalpy bounds
  [[nodiscard]] auto resolve_exhaust(ExpanderInlet& inlet) const -> std::expected<void, ExpanderSolverError>;

  [[nodiscard]] auto exhaust_property_or_nan(const ExpanderInlet& inlet, thermophysics::Property output,
                                             double h_ex) const -> double;

public:
  ExpanderSolver(const thermophysics::PropertyOracle& oracle, ExpanderConfig config);

  [[nodiscard]] auto config() const noexcept -> const ExpanderConfig& { return config_; }

  [[nodiscard]] auto solve(const thermophysics::Stream& supply, double exhaust_pressure,
                           double ambient_temperature) const -> std::expected<ExpanderResult, ExpanderSolverError>;
};

[[nodiscard]] auto validate_expander_config(const ExpanderConfig& config) -> std::expected<void, ExpanderSolverError>;

// Filling factor or efficiency regression at (rp, rho_su, N)
[[nodiscard]] auto evaluate_regression(const core::RegressionCoefficients& coefficients, double pressure_ratio,
                                       double supply_density, double speed) -> double;

} // namespace orckit::expander

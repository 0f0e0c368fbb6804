#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "../thermophysics/stream.hpp"
#include "hex_config.hpp"
#include "hex_types.hpp"
#include <expected>
#include <memory>

namespace orckit::hex {

struct ZoneCoefficients {
  double hot = 0.0;  // [W/(m²·K)]
  double cold = 0.0; // [W/(m²·K)]
  int closure_iterations = 0;
  bool closure_converged = true;
};

/**
 * @brief Convective coefficient strategy of an area-matching model
 *
 * evaluate() receives a zone whose boundary states, phases and log-mean temperature
 * difference are already set.
 */
class ConvectionStrategy {
public:
  virtual ~ConvectionStrategy() = default;

  [[nodiscard]] virtual auto evaluate(const Zone& zone, const thermophysics::SupplyConditions& hot,
                                      const thermophysics::SupplyConditions& cold) const
      -> std::expected<ZoneCoefficients, HexSolverError> = 0;
};

class ConstantConvection : public ConvectionStrategy {
private:
  ConstantCoefficientModel model_;

public:
  explicit ConstantConvection(ConstantCoefficientModel model) : model_(model) {}

  [[nodiscard]] auto evaluate(const Zone& zone, const thermophysics::SupplyConditions& hot,
                              const thermophysics::SupplyConditions& cold) const
      -> std::expected<ZoneCoefficients, HexSolverError> override;
};

class ScaledConvection : public ConvectionStrategy {
private:
  ScaledCoefficientModel model_;

public:
  explicit ScaledConvection(ScaledCoefficientModel model) : model_(model) {}

  [[nodiscard]] auto evaluate(const Zone& zone, const thermophysics::SupplyConditions& hot,
                              const thermophysics::SupplyConditions& cold) const
      -> std::expected<ZoneCoefficients, HexSolverError> override;
};

/**
 * @brief Literature correlations with properties from the oracle
 *
 * Hot two-phase zones use condensation correlations, cold two-phase zones boiling ones.
 * Boiling correlations depending on the local heat flux are closed by a bounded fixed point.
 */
class CorrelationConvection : public ConvectionStrategy {
private:
  const thermophysics::PropertyOracle& oracle_;
  CorrelationModel model_;
  SideGeometry hot_geometry_;
  SideGeometry cold_geometry_;
  PlateGeometry plate_;

  [[nodiscard]] auto single_phase(const Zone& zone, const thermophysics::SupplyConditions& side,
                                  const SideGeometry& geometry, const CorrelationSide& settings, bool hot_side) const
      -> std::expected<double, HexSolverError>;

  [[nodiscard]] auto condensation(const Zone& zone, const thermophysics::SupplyConditions& side) const
      -> std::expected<double, HexSolverError>;

  [[nodiscard]] auto boiling(const Zone& zone, const thermophysics::SupplyConditions& side, double h_hot,
                             ZoneCoefficients& coefficients) const -> std::expected<double, HexSolverError>;

public:
  CorrelationConvection(const thermophysics::PropertyOracle& oracle, CorrelationModel model,
                        SideGeometry hot_geometry, SideGeometry cold_geometry, PlateGeometry plate);

  [[nodiscard]] auto evaluate(const Zone& zone, const thermophysics::SupplyConditions& hot,
                              const thermophysics::SupplyConditions& cold) const
      -> std::expected<ZoneCoefficients, HexSolverError> override;
};

// Returns nullptr for models without convective coefficients
[[nodiscard]] auto create_convection_strategy(const HexConfig& config, const thermophysics::PropertyOracle& oracle)
    -> std::unique_ptr<ConvectionStrategy>;

} // namespace orckit::hex

#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "../thermophysics/stream.hpp"
#include "heat_transfer_zone_evaluator.hpp"
#include "hex_config.hpp"
#include "hex_types.hpp"
#include "zone_profile_builder.hpp"
#include <expected>

namespace orckit::hex {

/**
 * @brief Steady-state counter-flow heat exchanger solver
 *
 * Validates the streams, normalizes the stream roles when the model allows it, bounds the duty
 * by the zero-pinch maximum and determines the effective duty with the configured model:
 * a fixed fraction of the maximum (CstEff, PolEff), a target pinch (CstPinch) or the duty that
 * consumes the available area (hConvCst, hConvVar, hConvCor).
 *
 * Physically infeasible inputs never produce errors; they produce a zero-duty passthrough
 * result with a negative or degenerate flag. Errors are reserved for invalid configurations,
 * unknown fluids and unrecoverable property failures.
 */
class HexSolver {
private:
  const thermophysics::PropertyOracle& oracle_;
  HexConfig config_;

  struct DutySolution {
    double duty = 0.0;
    HexFlag flag = HexFlag::NotConverged;
    double residual = nan;
    int iterations = 0;
  };

  [[nodiscard]] auto solve_closed_form(const HexModel& model, const thermophysics::SupplyConditions& hot,
                                       const thermophysics::SupplyConditions& cold,
                                       const MaximumDuty& maximum) const -> DutySolution;

  [[nodiscard]] auto solve_constant_pinch(const ZoneProfileBuilder& builder, const ConstantPinchModel& model,
                                          const MaximumDuty& maximum) const
      -> std::expected<DutySolution, HexSolverError>;

  [[nodiscard]] auto solve_area_matching(const HexModel& model, const ZoneProfileBuilder& builder,
                                         const HeatTransferZoneEvaluator& evaluator,
                                         const MaximumDuty& maximum) const
      -> std::expected<DutySolution, HexSolverError>;

  [[nodiscard]] auto passthrough(const thermophysics::SupplyConditions& hot,
                                 const thermophysics::SupplyConditions& cold, const HexConfig& config,
                                 HexFlag flag) const -> std::expected<HexResult, HexSolverError>;

  [[nodiscard]] auto assemble(Profile& profile, const thermophysics::SupplyConditions& hot,
                              const thermophysics::SupplyConditions& cold, const HexConfig& config,
                              bool area_based) const -> std::expected<HexResult, HexSolverError>;

public:
  HexSolver(const thermophysics::PropertyOracle& oracle, HexConfig config);

  [[nodiscard]] auto config() const noexcept -> const HexConfig& { return config_; }

  [[nodiscard]] auto solve(const thermophysics::Stream& hot, const thermophysics::Stream& cold) const
      -> std::expected<HexResult, HexSolverError>;
};

// Checks the geometry and coefficients required by the configured model
[[nodiscard]] auto validate_hex_config(const HexConfig& config) -> std::expected<void, HexSolverError>;

// Configuration seen from the other stream: sides and side-attached coefficients exchanged
[[nodiscard]] auto reversed_config(const HexConfig& config) -> HexConfig;

// Maps a result solved with exchanged roles back onto the caller's hot/cold labels
void restore_stream_roles(HexResult& result);

} // namespace orckit::hex

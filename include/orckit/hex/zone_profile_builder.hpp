#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "../thermophysics/stream.hpp"
#include "hex_types.hpp"
#include <expected>
#include <vector>

namespace orckit::hex {

struct MaximumDuty {
  double duty = 0.0;
  double enthalpy_limited_duty = 0.0;
  double pinch = 0.0; // profile pinch at duty
  int iterations = 0;
};

/**
 * @brief Builds phase-segmented counter-flow profiles for a candidate duty
 *
 * Breakpoints are placed at both ends of the duty axis and wherever either stream crosses its
 * bubble or dew enthalpy. Two-phase zones are optionally split into equal-duty sub-zones.
 */
class ZoneProfileBuilder {
private:
  const thermophysics::PropertyOracle& oracle_;
  thermophysics::SupplyConditions hot_;
  thermophysics::SupplyConditions cold_;
  int two_phase_subdivisions_;

  [[nodiscard]] auto boundary_state(double duty, double h_hot_ex) const
      -> std::expected<BoundaryState, HexSolverError>;

  [[nodiscard]] auto breakpoints(double duty, double h_hot_ex, double h_cold_ex) const -> std::vector<double>;

public:
  ZoneProfileBuilder(const thermophysics::PropertyOracle& oracle, thermophysics::SupplyConditions hot,
                     thermophysics::SupplyConditions cold, int two_phase_subdivisions = 1);

  [[nodiscard]] auto hot() const noexcept -> const thermophysics::SupplyConditions& { return hot_; }
  [[nodiscard]] auto cold() const noexcept -> const thermophysics::SupplyConditions& { return cold_; }

  [[nodiscard]] auto build(double duty) const -> std::expected<Profile, HexSolverError>;

  [[nodiscard]] auto pinch(double duty) const -> std::expected<double, HexSolverError>;

  // Duty driving either stream to the supply temperature of the other one
  [[nodiscard]] auto enthalpy_limited_duty() const -> std::expected<double, HexSolverError>;

  // Duty at which the two profiles first touch (zero pinch), bounded by the enthalpy limit
  [[nodiscard]] auto maximum_duty() const -> std::expected<MaximumDuty, HexSolverError>;
};

[[nodiscard]] auto classify_phase(const thermophysics::SupplyConditions& side, double h_mean) noexcept -> ZonePhase;

} // namespace orckit::hex

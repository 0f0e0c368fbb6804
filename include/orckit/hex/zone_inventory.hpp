#pragma once
#include "../thermophysics/property_oracle.hpp"
#include "../thermophysics/stream.hpp"
#include "hex_config.hpp"
#include "hex_types.hpp"
#include <expected>

namespace orckit::hex {

struct InventoryTotals {
  double mass_hot = 0.0;  // [kg]
  double mass_cold = 0.0; // [kg]
};

/**
 * @brief Zone volumes and retained fluid mass on both sides of the exchanger
 *
 * Volumes are distributed by required area for area-matching models and by zone duty otherwise.
 * Single-phase zones use the mean of the end densities; two-phase zones weight the saturated
 * densities by the mean liquid volume fraction of the configured void fraction model.
 */
class ZoneInventory {
private:
  const thermophysics::PropertyOracle& oracle_;
  const HexConfig& config_;

  [[nodiscard]] auto side_mass(const Zone& zone, const thermophysics::SupplyConditions& side,
                               const SideGeometry& geometry, const VoidFractionSettings& void_fraction, bool hot_side,
                               double volume, double& weight) const -> std::expected<double, HexSolverError>;

public:
  // The configuration must outlive the inventory
  ZoneInventory(const thermophysics::PropertyOracle& oracle, const HexConfig& config)
      : oracle_(oracle), config_(config) {}

  [[nodiscard]] auto fill(Profile& profile, const thermophysics::SupplyConditions& hot,
                          const thermophysics::SupplyConditions& cold, bool area_based) const
      -> std::expected<InventoryTotals, HexSolverError>;
};

} // namespace orckit::hex

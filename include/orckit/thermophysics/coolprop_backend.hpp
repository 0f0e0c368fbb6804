#pragma once
#include "property_oracle.hpp"
#include <mutex>

namespace orckit::thermophysics {

/**
 * @brief PropertyOracle over the CoolProp high-level interface
 *
 * Pure and pseudo-pure fluids use their CoolProp names ("R245fa", "R134a", ...); incompressible
 * liquids use the "INCOMP::" prefix. Quality from (P, H) is extrapolated outside the dome so that
 * subcooled states read below 0 and superheated states above 1.
 */
class CoolPropBackend : public PropertyOracle {
private:
  // CoolProp caches its backends in process-wide tables
  mutable std::mutex mutex_;

  [[nodiscard]] auto props(std::string_view fluid, Property output, Property input1, double value1, Property input2,
                           double value2) const -> std::expected<double, PropertyUndefined>;
  [[nodiscard]] auto constant(std::string_view fluid, Property output) const
      -> std::expected<double, PropertyUndefined>;
  [[nodiscard]] auto extrapolated_quality(std::string_view fluid, Property input1, double value1, Property input2,
                                          double value2) const -> std::expected<double, PropertyUndefined>;

public:
  static constexpr std::string_view incompressible_prefix = "INCOMP::";

  [[nodiscard]] auto state(std::string_view fluid, Property output, Property input1, double value1, Property input2,
                           double value2) const -> std::expected<double, PropertyUndefined> override;

  [[nodiscard]] auto has_fluid(std::string_view fluid) const noexcept -> bool override;

  [[nodiscard]] auto is_incompressible(std::string_view fluid) const noexcept -> bool override;

  [[nodiscard]] auto fluid_names() const -> std::vector<std::string> override;
};

} // namespace orckit::thermophysics

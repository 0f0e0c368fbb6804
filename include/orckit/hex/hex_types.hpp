#pragma once
#include "../core/exceptions.hpp"
#include "hex_config.hpp"
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace orckit::hex {

class HexSolverError : public core::OrckitException {
public:
  explicit HexSolverError(std::string_view message, std::source_location location = std::source_location::current())
      : OrckitException(std::format("Heat Exchanger Error: {}", message), location) {}
};

enum class ZonePhase { Liquid, TwoPhase, Vapor };

[[nodiscard]] constexpr auto phase_name(ZonePhase phase) noexcept -> std::string_view {
  switch (phase) {
  case ZonePhase::Liquid:
    return "liq";
  case ZonePhase::TwoPhase:
    return "tp";
  case ZonePhase::Vapor:
    return "vap";
  }
  return "unknown";
}

enum class HexFlag : int {
  Converged = 1,
  DutyLimited = 2,
  Degenerate = 3,
  NotConverged = -1,
  InfeasiblePinch = -2,
  NoFlow = -3
};

inline constexpr double nan = std::numeric_limits<double>::quiet_NaN();

// Both streams at one position of the duty axis
struct BoundaryState {
  double duty = 0.0; // cumulative duty from the cold end [W]
  double h_hot = 0.0;
  double h_cold = 0.0;
  double T_hot = 0.0;
  double T_cold = 0.0;

  [[nodiscard]] auto approach() const noexcept -> double { return T_hot - T_cold; }
};

struct Zone {
  BoundaryState lower;
  BoundaryState upper;
  ZonePhase hot_phase = ZonePhase::Liquid;
  ZonePhase cold_phase = ZonePhase::Liquid;

  // Heat transfer (area-matching models only)
  double h_conv_hot = nan;
  double h_conv_cold = nan;
  double fin_efficiency_hot = 1.0;
  double fin_efficiency_cold = 1.0;
  double conductance = nan; // U referred to the hot side area [W/(m²·K)]
  double dt_log = nan;
  double area_hot = nan;
  double area_cold = nan;

  // Inventory
  double volume_hot = 0.0;
  double volume_cold = 0.0;
  double mass_hot = 0.0;
  double mass_cold = 0.0;
  double liquid_weight_hot = nan;
  double liquid_weight_cold = nan;

  [[nodiscard]] auto duty() const noexcept -> double { return upper.duty - lower.duty; }
  [[nodiscard]] auto mean_h_hot() const noexcept -> double { return 0.5 * (lower.h_hot + upper.h_hot); }
  [[nodiscard]] auto mean_h_cold() const noexcept -> double { return 0.5 * (lower.h_cold + upper.h_cold); }
};

/**
 * @brief Counter-flow temperature profile for one candidate duty
 *
 * Zones are ordered from the cold end (hot exhaust / cold supply, duty 0) to the hot end
 * (hot supply / cold exhaust, duty Q). No zone straddles a phase change on either side.
 */
struct Profile {
  std::vector<Zone> zones;
  double total_duty = 0.0;
  double pinch = 0.0;
  double h_hot_ex = 0.0;
  double h_cold_ex = 0.0;
  double T_hot_ex = 0.0;
  double T_cold_ex = 0.0;
};

struct HexResult {
  HexFlag flag = HexFlag::NoFlow;
  std::string model;
  bool reversed = false;

  double duty = 0.0;
  double duty_max = 0.0;
  double effectiveness = 0.0;
  double pinch = 0.0;
  double residual = nan; // area residual or relative pinch residual
  int iterations = 0;

  double h_hot_ex = 0.0;
  double h_cold_ex = 0.0;
  double T_hot_ex = 0.0;
  double T_cold_ex = 0.0;
  double mass_hot = 0.0;
  double mass_cold = 0.0;

  std::vector<Zone> zones;

  // Boundary vectors over zones.size() + 1 points, cold end first
  std::vector<double> duty_fraction;
  std::vector<double> geometric_fraction;
  std::vector<double> h_hot;
  std::vector<double> h_cold;
  std::vector<double> T_hot;
  std::vector<double> T_cold;
  std::vector<double> s_hot;
  std::vector<double> s_cold;
  std::vector<double> q_hot;
  std::vector<double> q_cold;

  // Mean convective coefficient per phase (NaN when the phase is absent)
  PhaseValues h_conv_hot_mean{nan, nan, nan};
  PhaseValues h_conv_cold_mean{nan, nan, nan};

  [[nodiscard]] auto flag_value() const noexcept -> int { return static_cast<int>(flag); }
};

} // namespace orckit::hex

#include "orckit/hex/void_fraction.hpp"
#include "orckit/core/constants.hpp"
#include "orckit/numerics/quadrature.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <optional>
#include <vector>

namespace orckit::hex {

namespace {

[[nodiscard]] auto slip_void_fraction(double q, double density_ratio, double slip) noexcept -> double {
  return 1.0 / (1.0 + ((1.0 - q) / q) * density_ratio * slip);
}

[[nodiscard]] auto lockhart_martinelli(double q, const TwoPhaseMixture& m) noexcept -> double {
  const double X_tt = std::pow((1.0 - q) / q, 0.9) *
                      std::sqrt(std::pow(m.mu_liquid / m.mu_vapor, 0.1) * (m.rho_vapor / m.rho_liquid));
  if (X_tt <= 10.0) {
    return std::pow(1.0 + std::pow(X_tt, 0.8), -0.378);
  }
  return 0.823 - 0.157 * std::log(X_tt);
}

[[nodiscard]] auto premoli(double q, const TwoPhaseMixture& m) noexcept -> double {
  const double Re_f = m.mass_flux * m.hydraulic_diameter / m.mu_liquid;
  const double We_f = m.mass_flux * m.mass_flux * m.hydraulic_diameter / m.surface_tension / m.rho_liquid;
  const double rho_ratio = m.rho_liquid / m.rho_vapor;
  const double y = rho_ratio * (q / (1.0 - q));
  const double F1 = 1.578 * std::pow(Re_f, -0.19) * std::pow(rho_ratio, 0.22);
  const double F2 = 0.0273 * We_f * std::pow(Re_f, -0.51) * std::pow(rho_ratio, -0.08);
  const double slip = 1.0 + F1 * std::sqrt(std::max(0.0, y / (1.0 + y * F2) - y * F2));
  return slip_void_fraction(q, m.rho_vapor / m.rho_liquid, slip);
}

// Fit of ln K_h against ln Z
constexpr std::array<double, 5> hughmark_fit = {-0.010060658854755, 0.155594796014726, -0.870912508715887,
                                                2.167004115373165, -2.224608445535130};

[[nodiscard]] auto hughmark(double q, const TwoPhaseMixture& m) -> std::expected<double, HexSolverError> {
  const double beta = 1.0 / (1.0 + ((1.0 - q) / q) * (m.rho_vapor / m.rho_liquid));
  const double D = m.hydraulic_diameter;
  const double G = m.mass_flux;

  auto residual = [&](double alpha) {
    const double Z = std::pow(D * G / (m.mu_liquid + alpha * (m.mu_vapor - m.mu_liquid)), 1.0 / 6.0) *
                     std::pow((1.0 / constants::physical::gravity / D) *
                                  std::pow(G * q / (m.rho_vapor * beta * (1.0 - beta)), 2),
                              1.0 / 8.0);
    const double ln_Z = std::log(Z);
    double ln_K = 0.0;
    for (const double c : hughmark_fit) {
      ln_K = ln_K * ln_Z + c;
    }
    return alpha - std::exp(ln_K) * beta;
  };

  numerics::RootFinderConfig config;
  config.relative_tolerance = 1e-8;
  config.absolute_tolerance = 1e-8;
  const numerics::BrentRootFinder solver(config);
  auto root = solver.solve(residual, 0.0, 1.0);
  if (!root) {
    return std::unexpected(
        HexSolverError(std::format("Hughmark void fraction at q = {}: {}", q, root.error().message())));
  }
  return root->root;
}

// Closed-form mass-averaged void fraction of the Zivi model over [x1, x2]
[[nodiscard]] auto zivi_integrated_void_fraction(double x1, double x2, const TwoPhaseMixture& m) noexcept -> double {
  const double S = std::pow(m.rho_vapor / m.rho_liquid, -1.0 / 3.0);
  const double K = m.rho_vapor / m.rho_liquid * S;
  const double numerator = K * (std::log(((x2 - 1.0) * K - x2) / ((x1 - 1.0) * K - x1)) + x2 - x1) + (x1 - x2);
  const double denominator = (x2 - x1) * K * K + 2.0 * K * (x1 - x2) + (x2 - x1);
  return -numerator / denominator;
}

// Composite grid refined near both ends: 4 points on the first and last tenth, 10 in between
[[nodiscard]] auto hughmark_grid(double q1, double q2) -> std::vector<double> {
  auto linspace = [](double a, double b, int n, std::vector<double>& out) {
    for (int i = 0; i < n; ++i) {
      out.push_back(a + (b - a) * i / (n - 1));
    }
  };
  const double a = 0.9 * q1 + 0.1 * q2;
  const double b = 0.1 * q1 + 0.9 * q2;
  std::vector<double> grid;
  grid.reserve(18);
  linspace(q1, a, 4, grid);
  linspace(a, b, 10, grid);
  linspace(b, q2, 4, grid);
  return grid;
}

} // namespace

auto void_fraction(const VoidFractionSettings& settings, const TwoPhaseMixture& mixture, double q)
    -> std::expected<double, HexSolverError> {
  const double density_ratio = mixture.rho_vapor / mixture.rho_liquid;

  switch (settings.model) {
  case VoidFractionModel::Homogenous:
    return slip_void_fraction(q, density_ratio, 1.0);
  case VoidFractionModel::Zivi:
  case VoidFractionModel::ZiviIntegrated:
    return slip_void_fraction(q, density_ratio, std::pow(density_ratio, -1.0 / 3.0));
  case VoidFractionModel::SlipRatio:
    return slip_void_fraction(q, density_ratio, settings.slip_ratio);
  case VoidFractionModel::LockhartMartinelli:
    return lockhart_martinelli(q, mixture);
  case VoidFractionModel::Premoli:
    return premoli(q, mixture);
  case VoidFractionModel::Hughmark:
    return hughmark(q, mixture);
  case VoidFractionModel::Personal:
    return settings.mass_averaged_void_fraction;
  }
  return std::unexpected(HexSolverError("unknown void fraction model"));
}

auto liquid_weight(const VoidFractionSettings& settings, const TwoPhaseMixture& mixture, double q1, double q2)
    -> std::expected<double, HexSolverError> {

  if (settings.model == VoidFractionModel::Personal) {
    return 1.0 - settings.mass_averaged_void_fraction;
  }

  // Degenerate zone: local value at the midpoint
  if (!(q2 - q1 > 1e-12)) {
    auto alpha = void_fraction(settings, mixture, 0.5 * (q1 + q2));
    if (!alpha) {
      return std::unexpected(alpha.error());
    }
    return 1.0 - *alpha;
  }

  if (settings.model == VoidFractionModel::ZiviIntegrated) {
    return 1.0 - zivi_integrated_void_fraction(q1, q2, mixture);
  }

  std::optional<HexSolverError> failure;
  auto liquid_fraction = [&](double q) -> double {
    if (q <= 0.0) {
      return 1.0;
    }
    if (q >= 1.0) {
      return 0.0;
    }
    auto alpha = void_fraction(settings, mixture, q);
    if (!alpha) {
      if (!failure) {
        failure = alpha.error();
      }
      return 0.0;
    }
    return 1.0 - *alpha;
  };

  double integral;
  if (settings.model == VoidFractionModel::Hughmark && settings.hughmark_simplified) {
    const auto grid = hughmark_grid(q1, q2);
    std::vector<double> values;
    values.reserve(grid.size());
    for (const double q : grid) {
      values.push_back(liquid_fraction(q));
    }
    integral = numerics::trapezoid(grid, values);
  } else {
    integral = numerics::integrate(liquid_fraction, q1, q2);
  }

  if (failure) {
    return std::unexpected(*failure);
  }
  return integral / (q2 - q1);
}

} // namespace orckit::hex

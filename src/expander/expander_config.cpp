#include "orckit/expander/expander_config.hpp"

namespace orckit::expander {

namespace {

// Heat capacity ratio used when no regression is configured
constexpr double default_gamma = 1.1;

} // namespace

GammaRegression::GammaRegression() : coefficients_(core::PolynomialCoefficients::Constant(1, 1, default_gamma)) {}

GammaRegression::GammaRegression(core::PolynomialCoefficients coefficients) : coefficients_(std::move(coefficients)) {}

auto GammaRegression::evaluate(double x, double y) const -> double {
  // Horner in y for every power of x
  double value = 0.0;
  for (Eigen::Index i = coefficients_.rows() - 1; i >= 0; --i) {
    double row = 0.0;
    for (Eigen::Index j = coefficients_.cols() - 1; j >= 0; --j) {
      row = row * y + coefficients_(i, j);
    }
    value = value * x + row;
  }
  return value;
}

auto model_name(const ExpanderModel& model) noexcept -> std::string_view {
  if (std::holds_alternative<ConstantEfficiencyModel>(model)) {
    return "CstEff";
  }
  if (std::holds_alternative<PolynomialEfficiencyModel>(model)) {
    return "PolEff";
  }
  return "SemiEmp";
}

} // namespace orckit::expander

#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <expected>
#include <format>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace orckit::numerics {

struct RootFinderConfig {
  double relative_tolerance = constants::tolerance::duty_relative;
  double absolute_tolerance = constants::tolerance::duty_absolute;
  double residual_tolerance = 0.0;
  int max_iterations = constants::iteration_limits::root_finder_max;
};

struct RootResult {
  double root = 0.0;
  double residual = 0.0;
  int iterations = 0;
  bool converged = false;
};

class RootFinderError : public core::OrckitException {
public:
  enum class Kind { NoBracket, ResidualFailure, InvalidInterval };

private:
  Kind kind_;
  double last_iterate_;

public:
  RootFinderError(Kind kind, std::string_view message, double last_iterate = std::numeric_limits<double>::quiet_NaN(),
                  std::source_location location = std::source_location::current())
      : OrckitException(std::format("Root Finder Error: {}", message), location), kind_(kind),
        last_iterate_(last_iterate) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
  [[nodiscard]] auto last_iterate() const noexcept -> double { return last_iterate_; }
};

namespace detail {

template <typename T> struct is_expected : std::false_type {};
template <typename T, typename E> struct is_expected<std::expected<T, E>> : std::true_type {};

// Residuals may be plain doubles or std::expected<double, E> with E exposing message()
template <typename F>
[[nodiscard]] auto evaluate_residual(F& f, double x) -> std::expected<double, std::string> {
  using Result = std::remove_cvref_t<std::invoke_result_t<F&, double>>;
  double value;
  if constexpr (is_expected<Result>::value) {
    auto result = f(x);
    if (!result) {
      return std::unexpected(std::format("residual failed at x = {}: {}", x, result.error().message()));
    }
    value = *result;
  } else {
    value = static_cast<double>(f(x));
  }
  if (!std::isfinite(value)) {
    return std::unexpected(std::format("non-finite residual at x = {}", x));
  }
  return value;
}

} // namespace detail

/**
 * @brief Bracketing 1-D root finder (Brent's method)
 *
 * Combines inverse quadratic interpolation, secant steps and bisection. The interval
 * [lower, upper] must bracket a sign change of f. Iterations are bounded by
 * max_iterations; exhausting them yields a result with converged = false.
 */
class BrentRootFinder {
private:
  RootFinderConfig config_;

public:
  explicit BrentRootFinder(const RootFinderConfig& config = {}) : config_(config) {}

  [[nodiscard]] auto config() const noexcept -> const RootFinderConfig& { return config_; }

  template <typename F>
  [[nodiscard]] auto solve(F&& f, double lower, double upper) const -> std::expected<RootResult, RootFinderError> {

    if (!std::isfinite(lower) || !std::isfinite(upper) || lower == upper) {
      return std::unexpected(RootFinderError(RootFinderError::Kind::InvalidInterval,
                                             std::format("invalid interval [{}, {}]", lower, upper), lower));
    }

    double a = lower;
    double b = upper;

    auto fa_result = detail::evaluate_residual(f, a);
    if (!fa_result) {
      return std::unexpected(RootFinderError(RootFinderError::Kind::ResidualFailure, fa_result.error(), a));
    }
    auto fb_result = detail::evaluate_residual(f, b);
    if (!fb_result) {
      return std::unexpected(RootFinderError(RootFinderError::Kind::ResidualFailure, fb_result.error(), b));
    }
    double fa = *fa_result;
    double fb = *fb_result;

    if (fa == 0.0) {
      return RootResult{a, fa, 0, true};
    }
    if (fb == 0.0) {
      return RootResult{b, fb, 0, true};
    }
    if (fa * fb > 0.0) {
      return std::unexpected(RootFinderError(
          RootFinderError::Kind::NoBracket,
          std::format("f({}) = {} and f({}) = {} do not bracket a root", a, fa, b, fb), std::abs(fa) < std::abs(fb) ? a : b));
    }

    if (std::abs(fa) < std::abs(fb)) {
      std::swap(a, b);
      std::swap(fa, fb);
    }

    double c = a;
    double fc = fa;
    double d = c;
    bool mflag = true;

    int count = 0;
    while (count < config_.max_iterations) {

      const double tol = 2.0 * config_.relative_tolerance * std::abs(b) + config_.absolute_tolerance;

      if (fb == 0.0 || std::abs(fb) <= config_.residual_tolerance || std::abs(b - a) <= tol) {
        return RootResult{b, fb, count, true};
      }

      ++count;

      double s;
      if (fa != fc && fb != fc) {
        s = a * fb * fc / ((fa - fb) * (fa - fc)) + b * fa * fc / ((fb - fa) * (fb - fc)) +
            c * fa * fb / ((fc - fa) * (fc - fb));
      } else {
        s = b - fb * (b - a) / (fb - fa);
      }

      const double quarter = (3.0 * a + b) / 4.0;
      const bool condition1 = !(s > std::min(quarter, b) && s < std::max(quarter, b));
      const bool condition2 = mflag && (std::abs(s - b) >= std::abs(b - c) / 2.0);
      const bool condition3 = !mflag && (std::abs(s - b) >= std::abs(c - d) / 2.0);
      const bool condition4 = mflag && (std::abs(b - c) < tol);
      const bool condition5 = !mflag && (std::abs(c - d) < tol);

      if (condition1 || condition2 || condition3 || condition4 || condition5) {
        s = 0.5 * (a + b);
        mflag = true;
      } else {
        mflag = false;
      }

      auto fs_result = detail::evaluate_residual(f, s);
      if (!fs_result) {
        return std::unexpected(RootFinderError(RootFinderError::Kind::ResidualFailure, fs_result.error(), b));
      }
      const double fs = *fs_result;

      d = c;
      c = b;
      fc = fb;

      if (fa * fs < 0.0) {
        b = s;
        fb = fs;
      } else {
        a = s;
        fa = fs;
      }

      if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
      }
    }

    return RootResult{b, fb, count, false};
  }
};

} // namespace orckit::numerics

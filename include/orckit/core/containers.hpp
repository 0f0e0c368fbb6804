#pragma once
#include <Eigen/Dense>
#include <array>
#include <memory>
#include <span>
#include <vector>

namespace orckit::core {

template <typename T>
using Vector = std::vector<T>;

template <typename T, std::size_t N>
using Array = std::array<T, N>;

template <typename T>
using Span = std::span<T>;

template <typename T>
using UniquePtr = std::unique_ptr<T>;

template <typename Scalar = double>
using MathVector = Eigen::Vector<Scalar, Eigen::Dynamic>;

template <typename Scalar = double, int Size = Eigen::Dynamic>
using FixedMathVector = Eigen::Vector<Scalar, Size>;

template <typename Scalar = double>
using MathMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

/// Coefficients c(i, j) of a bivariate polynomial sum c(i, j) x^i y^j
using PolynomialCoefficients = MathMatrix<double>;

/// Coefficients of a regression evaluated as a dot product with a feature vector
using RegressionCoefficients = MathVector<double>;

} // namespace orckit::core

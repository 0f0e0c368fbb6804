#include "orckit/hex/hex_config.hpp"

namespace orckit::hex {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace

auto model_name(const HexModel& model) noexcept -> std::string_view {
  return std::visit(overloaded{[](const ConstantPinchModel&) -> std::string_view { return "CstPinch"; },
                               [](const ConstantEffectivenessModel&) -> std::string_view { return "CstEff"; },
                               [](const PolynomialEffectivenessModel&) -> std::string_view { return "PolEff"; },
                               [](const ConstantCoefficientModel&) -> std::string_view { return "hConvCst"; },
                               [](const ScaledCoefficientModel&) -> std::string_view { return "hConvVar"; },
                               [](const CorrelationModel&) -> std::string_view { return "hConvCor"; }},
                    model);
}

auto is_area_matching(const HexModel& model) noexcept -> bool {
  return std::holds_alternative<ConstantCoefficientModel>(model) ||
         std::holds_alternative<ScaledCoefficientModel>(model) || std::holds_alternative<CorrelationModel>(model);
}

auto supports_stream_reversal(const HexModel& model) noexcept -> bool {
  return std::holds_alternative<ConstantEffectivenessModel>(model) ||
         std::holds_alternative<PolynomialEffectivenessModel>(model) ||
         std::holds_alternative<ScaledCoefficientModel>(model);
}

} // namespace orckit::hex

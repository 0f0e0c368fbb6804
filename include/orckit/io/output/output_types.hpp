#pragma once
#include "../../core/exceptions.hpp"
#include "../../expander/expander_types.hpp"
#include "../../hex/hex_types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace orckit::io::output {

class OutputError : public core::OrckitException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : OrckitException(std::format("Output Error: {}", message), location) {}
};

struct OutputMetadata {
  std::string case_name;
  std::string config_file;
  std::chrono::system_clock::time_point creation_time = std::chrono::system_clock::now();
};

// Everything one case run produces
struct OutputDataset {
  OutputMetadata metadata;
  std::optional<hex::HexResult> heat_exchanger;
  std::optional<expander::ExpanderResult> expander;
};

} // namespace orckit::io::output

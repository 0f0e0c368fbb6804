#include "orckit/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  orckit::core::ApplicationRunner runner;
  const auto result = runner.run(argc, argv);
  return static_cast<int>(result.exit_code);
}

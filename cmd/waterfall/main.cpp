#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/cli/exit_codes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/transfer_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_printer.hpp"
#include "internal/util/time.hpp"

using waterfall::cli::ToExitCode;
using waterfall::observability::DateField;
using waterfall::observability::StringField;

static void Usage() {
  std::cerr << "Usage: waterfall <config.yaml> OR waterfall --config <config.yaml> [--date YYYY-MM-DD] [--force]" << std::endl;
}

int main(int argc, char** argv) {
  std::string                          config_path;
  std::optional<waterfall::util::Date> date;
  waterfall::core::RunOptions          options;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--date" && i + 1 < argc) {
        date = waterfall::util::ParseDate(argv[++i]);
      } else if (arg == "--force") {
        options.force = true;
      } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
        config_path = arg;
      } else {
        Usage();
        return waterfall::cli::kExitUsage;
      }
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return waterfall::cli::kExitUsage;
  }

  if (config_path.empty()) {
    Usage();
    return waterfall::cli::kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = waterfall::config::ConfigLoader::LoadFromYaml(config_path);

    waterfall::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = waterfall::factory::BuildRuntime(config);

    const auto today = date.value_or(waterfall::util::Today());
    WATERFALL_LOG_INFO("Waterfall run started", {StringField("config", config_path), DateField("today", today)});

    auto result = runtime.orchestrator->Run(today, options);
    waterfall::report::PrintRunResult(std::cout, result, runtime.currency);

    WATERFALL_LOG_INFO("Waterfall run finished", {StringField("outcome", waterfall::core::ToString(result.outcome))});
    waterfall::observability::ShutdownLogging();
    return ToExitCode(result.outcome);
  } catch (const std::exception& e) {
    WATERFALL_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    waterfall::report::PrintFailure(std::cout, e);
    waterfall::observability::ShutdownLogging();
    return ToExitCode(e);
  }
}

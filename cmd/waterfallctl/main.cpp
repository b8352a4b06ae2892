#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cli/exit_codes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/transfer_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_printer.hpp"
#include "internal/util/time.hpp"

using namespace waterfall;

static void Usage() {
  std::cout << "Usage:\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] balances\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] preview\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] run [--force]\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] skip\n"
            << "  waterfallctl --config <config.yaml> advance\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] reset [next_payment_date]\n"
            << "  waterfallctl --config <config.yaml> [--date YYYY-MM-DD] status\n";
}

int main(int argc, char** argv) {
  std::string              config_path;
  std::optional<util::Date> date;
  std::vector<std::string> args;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--date" && i + 1 < argc) {
        date = util::ParseDate(argv[++i]);
      } else if (arg == "-h" || arg == "--help") {
        Usage();
        return cli::kExitOk;
      } else {
        args.push_back(arg);
      }
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return cli::kExitUsage;
  }

  if (config_path.empty() || args.empty()) {
    Usage();
    return cli::kExitUsage;
  }

  const std::string cmd = args[0];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto       runtime = factory::BuildRuntime(config);
    auto&      engine  = *runtime.orchestrator;
    const auto today   = date.value_or(util::Today());

    // ------------------------------------------------------------

    if (cmd == "balances") {
      report::PrintBalances(std::cout, engine.ReadAccounts(today), runtime.currency);
      return cli::kExitOk;
    }

    if (cmd == "preview") {
      report::PrintPreview(std::cout, engine.PreviewRun(today), runtime.currency);
      return cli::kExitOk;
    }

    if (cmd == "run") {
      core::RunOptions options;
      if (args.size() >= 2) {
        if (args[1] != "--force") {
          Usage();
          return cli::kExitUsage;
        }
        options.force = true;
      }

      auto result = engine.Run(today, options);
      report::PrintRunResult(std::cout, result, runtime.currency);
      return cli::ToExitCode(result.outcome);
    }

    if (cmd == "skip") {
      auto result = engine.Skip(today);
      report::PrintRunResult(std::cout, result, runtime.currency);
      return cli::ToExitCode(result.outcome);
    }

    if (cmd == "advance") {
      report::PrintSchedule(std::cout, engine.Advance());
      return cli::kExitOk;
    }

    if (cmd == "reset") {
      std::optional<util::Date> next;
      if (args.size() >= 2) {
        next = util::ParseDate(args[1]);
      }
      report::PrintSchedule(std::cout, engine.Reset(today, next));
      return cli::kExitOk;
    }

    if (cmd == "status") {
      report::PrintSchedule(std::cout, engine.Status(today));
      return cli::kExitOk;
    }

    Usage();
    return cli::kExitUsage;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return cli::kExitUsage;
  } catch (const std::exception& e) {
    WATERFALL_LOG_ERROR("Command failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    report::PrintFailure(std::cout, e);
    return cli::ToExitCode(e);
  }
}

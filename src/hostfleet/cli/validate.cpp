#include "hostfleet/cli/commands.hpp"
#include "hostfleet/cli/formatting.hpp"
#include "hostfleet/config/config.hpp"
#include "hostfleet/util/json.hpp"
#include "hostfleet/util/log.hpp"

#include <print>
#include <string>
#include <vector>

namespace hostfleet::cli {
namespace {

struct ValidationResult {
  std::string file;
  bool valid{false};
  std::vector<std::string> clusters;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  ValidationResult vr{.file = opts.config_file};

  auto config_res = ConfigLoader::parse_file(opts.config_file);
  if (!config_res) {
    vr.errors.push_back(config_res.error().message());
  } else {
    auto report = ConfigLoader::validate(*config_res);
    vr.valid = report.valid();
    vr.clusters = config_res->cluster_names();
    vr.errors = std::move(report.errors);
    vr.warnings = std::move(report.warnings);
  }

  if (opts.json) {
    std::println("{}", to_json(vr));
    return vr.valid ? 0 : 1;
  }

  for (const auto &warning : vr.warnings) {
    std::println("  {} {}", fmt::ansi::yellow("warning:"), warning);
  }
  for (const auto &error : vr.errors) {
    std::println("  {} {}", fmt::ansi::red("error:"), error);
  }
  if (vr.valid) {
    std::println("{} {} ({} cluster(s))", fmt::ansi::green("OK"), vr.file,
                 vr.clusters.size());
    return 0;
  }
  std::println("{} {}", fmt::ansi::red("INVALID"), vr.file);
  return 1;
}

} // namespace hostfleet::cli

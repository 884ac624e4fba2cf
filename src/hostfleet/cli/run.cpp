#include "hostfleet/app/application.hpp"
#include "hostfleet/cli/commands.hpp"
#include "hostfleet/config/conf_macros.hpp"
#include "hostfleet/config/config.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/log.hpp"

#include <filesystem>
#include <print>
#include <string>

namespace hostfleet::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<FleetConfig> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<FleetConfig> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

} // namespace

auto cmd_run(const RunCommandOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  const auto config_path = std::filesystem::absolute(opts.config_file);

  auto macros = parse_macro_args(opts.macros);
  if (!macros) {
    std::println(stderr, "Error: macros must be given as NAME=value");
    return 1;
  }

  auto context = parse<StartContext>(opts.context);
  if (!context) {
    std::println(stderr, "Error: Unknown start context '{}'", opts.context);
    return 1;
  }

  if (opts.log_level.has_value()) {
    config.fleet.log_level = *opts.log_level;
  }

  const auto log_file = opts.log_file.value_or(config.fleet.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  log::set_level(config.fleet.log_level);

  RunOptions run_opts{
      .config_file = config_path.string(),
      .macros = std::move(*macros),
      .argv = opts.argv,
      .context = *context,
      .lobby_fd = opts.lobby_fd,
  };

  Application app(std::move(config), std::move(run_opts));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    return 1;
  }
  return app.run();
}

} // namespace hostfleet::cli

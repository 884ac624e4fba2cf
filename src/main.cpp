#include "hostfleet/cli/commands.hpp"
#include "hostfleet/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib> // getenv
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("HOSTFLEET_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-run CLI output clean by default.
  hostfleet::log::set_output_stderr();
  hostfleet::log::set_level(hostfleet::log::Level::Warn);

  CLI::App app{"hostfleet", "Game host instance fleet manager"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  hostfleet run -c fleet.toml\n"
             "  hostfleet status -c fleet.toml --json\n"
             "\nTip: Set HOSTFLEET_CONFIG=fleet.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  hostfleet::cli::RunCommandOptions run_opts;
  run_opts.argv.assign(argv, argv + argc);
  auto *run = app.add_subcommand(
      "run", "Run the fleet manager, or one instance when given its macros");
  run->footer("\nExamples:\n"
              "  hostfleet run -c fleet.toml\n"
              "  hostfleet run -c fleet.toml --daemon --log-file fleet.log\n"
              "  hostfleet run -c fleet.toml ManagerName=Fleet InstNb=1 ...");
  run_opts.config_file = env_config;
  auto *run_cfg =
      run->add_option("-c,--config", run_opts.config_file, "Fleet config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    run_cfg->required();
  run->add_option("--log-file", run_opts.log_file,
                  "Log file path (required for --daemon)");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->add_option("--context", run_opts.context,
                  "Instance start context: autoload|load|reload");
  run->add_option("--lobby-fd", run_opts.lobby_fd,
                  "File descriptor carrying lobby events (default: stdin)");
  run->add_flag("-d,--daemon", run_opts.daemon, "Run as daemon");
  run->add_option("macros", run_opts.macros,
                  "Configuration macros as NAME=value");
  run->callback(
      [&run_opts]() { std::exit(hostfleet::cli::cmd_run(run_opts)); });

  hostfleet::cli::StatusOptions status_opts;
  auto *status =
      app.add_subcommand("status", "Show instances recorded in the PID directory");
  status_opts.config_file = env_config;
  auto *status_cfg = status
                         ->add_option("-c,--config", status_opts.config_file,
                                      "Fleet config file")
                         ->check(CLI::ExistingFile);
  if (env_config.empty())
    status_cfg->required();
  status->add_option("--cluster", status_opts.cluster,
                     "Only show instances of this cluster");
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback(
      [&status_opts]() { std::exit(hostfleet::cli::cmd_status(status_opts)); });

  hostfleet::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Check a fleet configuration file");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "Fleet config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(hostfleet::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}

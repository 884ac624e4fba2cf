#include "hostfleet/launcher/process_launcher.hpp"

#include "hostfleet/util/log.hpp"

#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <cerrno>
#include <optional>
#include <unistd.h>

namespace hostfleet {

namespace {

namespace bp = boost::process::v2;

// Launcher initializer run in the child between fork and exec.
struct new_session {
  template <typename Launcher>
  auto on_exec_setup(Launcher &, const bp::filesystem::path &,
                     const char *const *) -> bp::error_code {
    if (::setsid() < 0) {
      return bp::error_code(errno, bp::system_category());
    }
    return {};
  }
};

} // namespace

auto DetachedProcessLauncher::launch(const LaunchRequest &request)
    -> Result<std::int64_t> {
  if (request.executable.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::optional<bp::process> proc;
  try {
    auto stdio = request.inherit_console
                     ? bp::process_stdio{}
                     : bp::process_stdio{
                           .in = nullptr, .out = nullptr, .err = nullptr};
    if (request.working_dir.empty()) {
      proc.emplace(io_.get_executor(), request.executable, request.args,
                   std::move(stdio), new_session{});
    } else {
      proc.emplace(io_.get_executor(), request.executable, request.args,
                   std::move(stdio),
                   bp::process_start_dir{request.working_dir},
                   new_session{});
    }
  } catch (const std::exception &ex) {
    log::error("Unable to create detached process {}: {}", request.executable,
               ex.what());
    return fail(Error::SpawnFailed);
  }

  const auto pid = static_cast<std::int64_t>(proc->id());
  proc->detach();
  log::debug("Detached process started pid={} exe={}", pid,
             request.executable);
  return ok(pid);
}

} // namespace hostfleet

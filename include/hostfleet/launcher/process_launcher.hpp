#pragma once

#include "hostfleet/core/error.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace hostfleet {

struct LaunchRequest {
  std::string executable;
  std::vector<std::string> args;
  std::string working_dir;
  // Share the manager's terminal instead of discarding instance output.
  bool inherit_console{false};
};

class InstanceLauncher {
public:
  virtual ~InstanceLauncher() = default;

  // Starts a detached process and returns its pid. Never waits for it.
  [[nodiscard]] virtual auto launch(const LaunchRequest &request)
      -> Result<std::int64_t> = 0;
};

// Spawns instances in their own session so they outlive the manager and do
// not receive its terminal signals. Exited children are reaped by the
// application's SIGCHLD handler.
class DetachedProcessLauncher final : public InstanceLauncher {
public:
  explicit DetachedProcessLauncher(boost::asio::io_context &io) : io_(io) {}

  [[nodiscard]] auto launch(const LaunchRequest &request)
      -> Result<std::int64_t> override;

private:
  boost::asio::io_context &io_;
};

} // namespace hostfleet

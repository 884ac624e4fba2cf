#pragma once

#include "hostfleet/core/error.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

// Line-oriented lobby bridge: lobby state changes arrive as text lines
// (normally on stdin) and actions are written as lobby protocol commands
// (normally on stdout), so a supervising process can drive the fleet.
//
//   connected | disconnected
//   online <user> [bot] [mod]     offline <user>
//   battle <founder> <size>       closed <founder>
//   joined <founder> <user>       left <founder> <user>
//   status <user> ingame|idle [bot]
//   pm <user> <text...>           cmd <user> <command...>
class ConsoleLobby final : public LobbyView {
public:
  using EventHandler = std::move_only_function<void(const LobbyEvent &)>;
  using CloseHandler = std::move_only_function<void()>;

  explicit ConsoleLobby(std::FILE *output = stdout) : output_(output) {}

  auto set_event_handler(EventHandler handler) -> void {
    on_event_ = std::move(handler);
  }
  auto set_close_handler(CloseHandler handler) -> void {
    on_close_ = std::move(handler);
  }

  // Reads lines from `fd` until end of input, dispatching their events.
  [[nodiscard]] auto start(boost::asio::io_context &io, int fd)
      -> Result<void>;
  auto stop() -> void;

  // Updates lobby state from one input line and returns the resulting
  // events. Malformed lines produce none.
  [[nodiscard]] auto apply_line(std::string_view line)
      -> std::vector<LobbyEvent>;

  [[nodiscard]] auto is_connected() const -> bool override {
    return connected_;
  }
  [[nodiscard]] auto is_online(std::string_view user) const -> bool override;
  [[nodiscard]] auto is_in_game(std::string_view user) const -> bool override;
  [[nodiscard]] auto is_bot(std::string_view user) const -> bool override;
  [[nodiscard]] auto has_moderator_access(std::string_view user) const
      -> bool override;
  [[nodiscard]] auto hosted_battle_size(std::string_view founder) const
      -> std::optional<std::size_t> override;

  auto send_private(std::string_view user, std::string_view message)
      -> void override;
  auto create_bot_account(std::string_view name, std::string_view creator)
      -> void override;
  auto set_bot_mode(std::string_view user, bool enabled) -> void override;

private:
  struct UserState {
    bool bot{false};
    bool moderator{false};
    bool in_game{false};
  };
  template <typename V>
  using NameMap =
      ankerl::unordered_dense::map<std::string, V, StringHash, StringEqual>;

  std::FILE *output_;
  bool connected_{false};
  NameMap<UserState> users_;
  NameMap<std::size_t> battles_;
  EventHandler on_event_;
  CloseHandler on_close_;
  std::shared_ptr<boost::asio::posix::stream_descriptor> input_;

  auto dispatch(std::string_view line) -> void;
  auto write_command(std::string_view command) -> void;
};

} // namespace hostfleet

#pragma once

#include "hostfleet/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hostfleet {

enum class LobbyEventKind : std::uint8_t {
  Connected,
  Disconnected,
  UserOnline,
  UserOffline,
  JoinedBattle,
  LeftBattle,
  // Battle is about to be removed; battle data is still visible.
  BattleClosing,
  BattleClosed,
  StatusChanged,
  PrivateMessage,
  Command,
};
BOOST_DESCRIBE_ENUM(LobbyEventKind, Connected, Disconnected, UserOnline,
                    UserOffline, JoinedBattle, LeftBattle, BattleClosing,
                    BattleClosed, StatusChanged, PrivateMessage, Command)
HOSTFLEET_DEFINE_ENUM_SERDE(LobbyEventKind)

// One lobby notification. Lobby state queried through LobbyView already
// reflects the event when it is dispatched.
struct LobbyEvent {
  LobbyEventKind kind{LobbyEventKind::Connected};
  std::string user;    // user concerned, message or command sender
  std::string founder; // battle founder for battle events
  std::string text;    // private message or command line
};

// Read-only view of lobby state plus the few actions the fleet needs. The
// lobby protocol client lives outside this project.
class LobbyView {
public:
  virtual ~LobbyView() = default;

  [[nodiscard]] virtual auto is_connected() const -> bool = 0;
  [[nodiscard]] virtual auto is_online(std::string_view user) const -> bool = 0;
  [[nodiscard]] virtual auto is_in_game(std::string_view user) const
      -> bool = 0;
  [[nodiscard]] virtual auto is_bot(std::string_view user) const -> bool = 0;
  [[nodiscard]] virtual auto has_moderator_access(std::string_view user) const
      -> bool = 0;
  // Users in the battle hosted by `founder`, founder included; nullopt when
  // the user hosts no battle.
  [[nodiscard]] virtual auto hosted_battle_size(std::string_view founder) const
      -> std::optional<std::size_t> = 0;

  virtual auto send_private(std::string_view user, std::string_view message)
      -> void = 0;
  virtual auto create_bot_account(std::string_view name,
                                  std::string_view creator) -> void = 0;
  virtual auto set_bot_mode(std::string_view user, bool enabled) -> void = 0;
};

} // namespace hostfleet

#include "hostfleet/lobby/console_lobby.hpp"

#include "hostfleet/core/coroutine.hpp"
#include "hostfleet/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <unistd.h>

namespace hostfleet {

namespace {

// Splits off the first whitespace-separated word of `rest`.
[[nodiscard]] auto next_word(std::string_view &rest) -> std::string_view {
  const auto begin = rest.find_first_not_of(" \t");
  if (begin == std::string_view::npos) {
    rest = {};
    return {};
  }
  rest.remove_prefix(begin);
  const auto end = rest.find_first_of(" \t");
  const auto word = rest.substr(0, end);
  rest = end == std::string_view::npos ? std::string_view{}
                                       : rest.substr(end + 1);
  return word;
}

[[nodiscard]] auto remaining_text(std::string_view rest) -> std::string {
  std::string text(rest);
  boost::algorithm::trim(text);
  return text;
}

} // namespace

auto ConsoleLobby::start(boost::asio::io_context &io, int fd)
    -> Result<void> {
  const int owned = ::dup(fd);
  if (owned < 0) {
    log::error("Unable to open lobby input: {}", std::strerror(errno));
    return fail(std::error_code(errno, std::system_category()));
  }
  input_ = std::make_shared<boost::asio::posix::stream_descriptor>(io, owned);

  co_spawn(
      io,
      [this, input = input_]() -> task<void> {
        std::string buffer;
        while (input->is_open()) {
          boost::system::error_code ec;
          const auto n = co_await boost::asio::async_read_until(
              *input, boost::asio::dynamic_buffer(buffer), '\n',
              boost::asio::redirect_error(use_awaitable, ec));
          if (ec == boost::asio::error::operation_aborted) {
            co_return;
          }
          if (ec) {
            if (ec != boost::asio::error::eof) {
              log::warn("Lobby input read error: {}", ec.message());
            }
            if (!buffer.empty()) {
              dispatch(buffer);
            }
            break;
          }
          const std::string line = buffer.substr(0, n - 1);
          buffer.erase(0, n);
          dispatch(line);
        }
        log::info("Lobby input closed");
        if (on_close_) {
          on_close_();
        }
      },
      detached);
  return ok();
}

auto ConsoleLobby::stop() -> void {
  if (input_) {
    boost::system::error_code ec;
    input_->cancel(ec);
    input_->close(ec);
    input_.reset();
  }
}

auto ConsoleLobby::dispatch(std::string_view line) -> void {
  for (const auto &event : apply_line(line)) {
    if (on_event_) {
      on_event_(event);
    }
  }
}

auto ConsoleLobby::apply_line(std::string_view line)
    -> std::vector<LobbyEvent> {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  std::string_view rest = line;
  const auto verb = next_word(rest);
  if (verb.empty()) {
    return {};
  }

  const auto malformed = [&]() -> std::vector<LobbyEvent> {
    log::warn("Ignoring malformed lobby input line: {}", line);
    return {};
  };
  const auto event = [](LobbyEventKind kind, std::string_view user,
                        std::string_view founder = {},
                        std::string text = {}) {
    return LobbyEvent{.kind = kind,
                      .user = std::string(user),
                      .founder = std::string(founder),
                      .text = std::move(text)};
  };

  if (verb == "connected") {
    connected_ = true;
    return {event(LobbyEventKind::Connected, {})};
  }
  if (verb == "disconnected") {
    connected_ = false;
    users_.clear();
    battles_.clear();
    return {event(LobbyEventKind::Disconnected, {})};
  }

  const auto user = next_word(rest);
  if (user.empty()) {
    return malformed();
  }

  if (verb == "online") {
    UserState state;
    for (auto flag = next_word(rest); !flag.empty(); flag = next_word(rest)) {
      state.bot = state.bot || flag == "bot";
      state.moderator = state.moderator || flag == "mod";
    }
    users_.insert_or_assign(std::string(user), state);
    return {event(LobbyEventKind::UserOnline, user)};
  }
  if (verb == "offline") {
    users_.erase(user);
    battles_.erase(user);
    return {event(LobbyEventKind::UserOffline, user)};
  }
  if (verb == "battle") {
    std::size_t size = 1;
    try {
      size = boost::lexical_cast<std::size_t>(std::string(next_word(rest)));
    } catch (const boost::bad_lexical_cast &) {
      return malformed();
    }
    battles_.insert_or_assign(std::string(user),
                              std::max<std::size_t>(size, 1));
    return {};
  }
  if (verb == "closed") {
    std::vector<LobbyEvent> events{
        event(LobbyEventKind::BattleClosing, {}, user)};
    battles_.erase(user);
    events.push_back(event(LobbyEventKind::BattleClosed, {}, user));
    return events;
  }
  if (verb == "joined" || verb == "left") {
    const auto member = next_word(rest);
    if (member.empty()) {
      return malformed();
    }
    auto [it, inserted] = battles_.try_emplace(std::string(user), 1);
    if (verb == "joined") {
      ++it->second;
      return {event(LobbyEventKind::JoinedBattle, member, user)};
    }
    if (it->second > 1) {
      --it->second;
    }
    return {event(LobbyEventKind::LeftBattle, member, user)};
  }
  if (verb == "status") {
    auto it = users_.find(user);
    if (it == users_.end()) {
      return malformed();
    }
    const auto state = next_word(rest);
    if (state != "ingame" && state != "idle") {
      return malformed();
    }
    it->second.in_game = state == "ingame";
    if (next_word(rest) == "bot") {
      it->second.bot = true;
    }
    return {event(LobbyEventKind::StatusChanged, user)};
  }
  if (verb == "pm") {
    return {event(LobbyEventKind::PrivateMessage, user, {},
                  remaining_text(rest))};
  }
  if (verb == "cmd") {
    return {event(LobbyEventKind::Command, user, {}, remaining_text(rest))};
  }
  return malformed();
}

auto ConsoleLobby::is_online(std::string_view user) const -> bool {
  return users_.contains(user);
}

auto ConsoleLobby::is_in_game(std::string_view user) const -> bool {
  auto it = users_.find(user);
  return it != users_.end() && it->second.in_game;
}

auto ConsoleLobby::is_bot(std::string_view user) const -> bool {
  auto it = users_.find(user);
  return it != users_.end() && it->second.bot;
}

auto ConsoleLobby::has_moderator_access(std::string_view user) const -> bool {
  auto it = users_.find(user);
  return it != users_.end() && it->second.moderator;
}

auto ConsoleLobby::hosted_battle_size(std::string_view founder) const
    -> std::optional<std::size_t> {
  auto it = battles_.find(founder);
  if (it == battles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ConsoleLobby::write_command(std::string_view command) -> void {
  std::println(output_, "{}", command);
  std::fflush(output_);
}

auto ConsoleLobby::send_private(std::string_view user,
                                std::string_view message) -> void {
  write_command(std::format("SAYPRIVATE {} {}", user, message));
}

auto ConsoleLobby::create_bot_account(std::string_view name,
                                      std::string_view creator) -> void {
  write_command(std::format("CREATEBOTACCOUNT {} {}", name, creator));
}

auto ConsoleLobby::set_bot_mode(std::string_view user, bool enabled) -> void {
  write_command(std::format("SETBOTMODE {} {}", user, enabled ? 1 : 0));
}

} // namespace hostfleet

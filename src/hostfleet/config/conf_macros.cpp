#include "hostfleet/config/conf_macros.hpp"

#include "hostfleet/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <string>

namespace hostfleet {

namespace {

auto insert_token(MacroMap &out, std::string_view token) -> Result<void> {
  const auto eq = token.find('=');
  if (eq == std::string_view::npos || eq == 0) {
    return fail(Error::ParseError);
  }
  out.insert_or_assign(std::string(token.substr(0, eq)),
                       std::string(token.substr(eq + 1)));
  return ok();
}

} // namespace

auto parse_macro_string(std::string_view text) -> Result<MacroMap> {
  MacroMap out;
  const auto input = boost::algorithm::trim_copy(std::string(text));
  if (input.empty()) {
    return ok(std::move(out));
  }

  using Separator = boost::escaped_list_separator<char>;
  try {
    boost::tokenizer<Separator> tokens(
        input, Separator(std::string("\\"), std::string(" \t"),
                         std::string("\"'")));
    for (const auto &token : tokens) {
      if (token.empty()) {
        continue;
      }
      if (auto r = insert_token(out, token); !r) {
        log::debug("Invalid configuration macro token: {}", token);
        return fail(r.error());
      }
    }
  } catch (const boost::escaped_list_error &e) {
    log::debug("Invalid configuration macro string \"{}\": {}", input,
               e.what());
    return fail(Error::ParseError);
  }
  return ok(std::move(out));
}

auto parse_macro_args(std::span<const std::string> args) -> Result<MacroMap> {
  MacroMap out;
  for (const auto &arg : args) {
    if (auto r = insert_token(out, arg); !r) {
      log::error("Invalid configuration macro argument: {}", arg);
      return fail(Error::InvalidArgument);
    }
  }
  return ok(std::move(out));
}

auto expand_placeholders(std::string_view text, const MacroMap &values)
    -> std::string {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find('%', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    const auto close = text.find('%', open + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(open));
      break;
    }
    const auto name = text.substr(open + 1, close - open - 1);
    if (auto it = values.find(name); it != values.end()) {
      out.append(it->second);
      pos = close + 1;
    } else {
      // Keep the '%' and retry from the closing one, which may open a
      // placeholder of its own.
      out.push_back('%');
      pos = open + 1;
    }
  }
  return out;
}

auto contains_placeholder(std::string_view text, std::string_view name)
    -> bool {
  const auto needle = std::string("%").append(name).append("%");
  return text.find(needle) != std::string_view::npos;
}

} // namespace hostfleet

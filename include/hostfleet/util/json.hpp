#pragma once

#include "hostfleet/core/error.hpp"
#include "hostfleet/util/log.hpp"

#include <glaze/json.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace hostfleet {

template <typename T> [[nodiscard]] auto to_json(const T &value) -> std::string {
  auto out = glz::write<glz::opts{.prettify = true}>(value);
  return out ? *out : "null";
}

template <typename T>
[[nodiscard]] auto from_json(std::string_view input) -> Result<T> {
  T value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    log::error("JSON parse error: {}", glz::format_error(ec, input));
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

template <typename T>
[[nodiscard]] auto read_json_file(const std::string &path) -> Result<T> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return from_json<T>(text);
}

template <typename T>
[[nodiscard]] auto write_json_file(const std::string &path, const T &value)
    -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  out << to_json(value) << '\n';
  out.flush();
  if (!out.good()) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

} // namespace hostfleet

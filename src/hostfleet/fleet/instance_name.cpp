#include "hostfleet/fleet/instance_name.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace hostfleet {

namespace {

constexpr std::array kNumberingPlaceholders = {
    std::string_view{"InstNb"},      std::string_view{"InstNb2"},
    std::string_view{"InstNb3"},     std::string_view{"InstNb0"},
    std::string_view{"ClustInstNb"}, std::string_view{"ClustInstNb2"},
    std::string_view{"ClustInstNb3"}, std::string_view{"ClustInstNb0"}};

} // namespace

auto auto_digits(int max_value) noexcept -> int {
  int value = std::max(max_value - 1, 0);
  int digits = 1;
  while (value >= 10) {
    value /= 10;
    ++digits;
  }
  return digits;
}

auto naming_placeholders(const NamingInputs &inputs) -> MacroMap {
  const int inst_digits = auto_digits(inputs.max_instances);
  const int clust_digits = inputs.max_instances_in_cluster > 0
                               ? auto_digits(inputs.max_instances_in_cluster)
                               : inst_digits;
  const int n = inputs.instance_number;
  const int c = inputs.cluster_number;
  return MacroMap{
      {"InstNb", std::format("{}", n)},
      {"InstNb2", std::format("{:02}", n)},
      {"InstNb3", std::format("{:03}", n)},
      {"InstNb0", std::format("{:0{}}", n, inst_digits)},
      {"ClustInstNb", std::format("{}", c)},
      {"ClustInstNb2", std::format("{:02}", c)},
      {"ClustInstNb3", std::format("{:03}", c)},
      {"ClustInstNb0", std::format("{:0{}}", c, clust_digits)},
      {"PresetName", std::string(inputs.cluster)},
      {"ManagerName", std::string(inputs.manager_name)},
      {"OwnerName", std::string(inputs.owner)},
  };
}

auto render_instance_name(std::string_view name_template,
                          const MacroMap &placeholders) -> std::string {
  std::string tmpl(name_template);
  const bool numbered = std::ranges::any_of(
      kNumberingPlaceholders, [&](std::string_view placeholder) {
        return contains_placeholder(tmpl, placeholder);
      });
  if (!numbered) {
    tmpl += "%ClustInstNb0%";
  }
  return expand_placeholders(tmpl, placeholders);
}

auto is_valid_instance_name(std::string_view name) noexcept -> bool {
  if (name.size() < 2 || name.size() > 20) {
    return false;
  }
  return std::ranges::all_of(name, [](char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return std::isalnum(c) != 0 || c == '_' || c == '[' || c == ']';
  });
}

} // namespace hostfleet

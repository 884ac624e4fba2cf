#pragma once

#include "hostfleet/config/conf_macros.hpp"

#include <string>
#include <string_view>

namespace hostfleet {

struct NamingInputs {
  int instance_number{0};
  int cluster_number{0};
  std::string_view cluster;
  std::string_view manager_name;
  std::string_view owner;
  int max_instances{1};
  // 0 when the cluster is unbounded.
  int max_instances_in_cluster{0};
};

// Placeholder values usable in name templates and instance macros:
// InstNb, InstNb2, InstNb3, InstNb0, ClustInstNb*, PresetName, ManagerName,
// OwnerName.
[[nodiscard]] auto naming_placeholders(const NamingInputs &inputs) -> MacroMap;

// Substitutes placeholders; a template without any numbering placeholder gets
// %ClustInstNb0% appended first.
[[nodiscard]] auto render_instance_name(std::string_view name_template,
                                        const MacroMap &placeholders)
    -> std::string;

// 2 to 20 characters among letters, digits, '_', '[' and ']'.
[[nodiscard]] auto is_valid_instance_name(std::string_view name) noexcept
    -> bool;

// Digits needed to print max_value - 1.
[[nodiscard]] auto auto_digits(int max_value) noexcept -> int;

} // namespace hostfleet

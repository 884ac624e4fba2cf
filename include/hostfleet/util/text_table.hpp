#pragma once

#include <algorithm>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet::util {

// Plain-text table rendered into lines, so the same output can be sent as
// private messages or printed on a terminal.
class TextTable {
public:
  explicit TextTable(std::vector<std::string> headers)
      : headers_(std::move(headers)) {}

  auto add_row(std::vector<std::string> values) -> void {
    values.resize(headers_.size());
    rows_.push_back(std::move(values));
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }

  [[nodiscard]] auto render(std::string_view title = {}) const
      -> std::vector<std::string> {
    std::vector<std::size_t> widths;
    widths.reserve(headers_.size());
    for (const auto &h : headers_) {
      widths.push_back(h.size());
    }
    for (const auto &row : rows_) {
      for (std::size_t i = 0; i < row.size(); ++i) {
        widths[i] = std::max(widths[i], row[i].size());
      }
    }

    std::size_t total_width = 0;
    for (auto w : widths)
      total_width += w;
    total_width += 3 * (widths.size() - 1);

    std::vector<std::string> lines;
    lines.reserve(rows_.size() + 4);
    if (!title.empty()) {
      lines.push_back(center(title, total_width));
    }
    lines.push_back(format_row(headers_, widths));
    lines.push_back(std::string(total_width, '-'));
    for (const auto &row : rows_) {
      lines.push_back(format_row(row, widths));
    }
    return lines;
  }

private:
  std::vector<std::string> headers_;
  std::vector<std::vector<std::string>> rows_;

  [[nodiscard]] static auto format_row(const std::vector<std::string> &values,
                                       const std::vector<std::size_t> &widths)
      -> std::string {
    std::string line;
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (i > 0)
        line += " | ";
      std::format_to(std::back_inserter(line), "{:<{}}", values[i], widths[i]);
    }
    while (!line.empty() && line.back() == ' ')
      line.pop_back();
    return line;
  }

  [[nodiscard]] static auto center(std::string_view text, std::size_t width)
      -> std::string {
    const std::string decorated = std::format("[ {} ]", text);
    if (decorated.size() >= width) {
      return decorated;
    }
    const auto pad = (width - decorated.size()) / 2;
    return std::format("{}{}{}", std::string(pad, '*'), decorated,
                       std::string(width - decorated.size() - pad, '*'));
  }
};

} // namespace hostfleet::util

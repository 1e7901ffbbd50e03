#include "genarena/common/diagnostic.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace genarena {

namespace {

auto GetSeverityString(DiagnosticSeverity severity) -> std::string_view {
  switch (severity) {
    case DiagnosticSeverity::kWarning:
      return "warning";
    case DiagnosticSeverity::kError:
      return "error";
  }
  return "unknown";
}

auto GetSeverityColor(DiagnosticSeverity severity) -> fmt::terminal_color {
  switch (severity) {
    case DiagnosticSeverity::kWarning:
      return fmt::terminal_color::bright_yellow;
    case DiagnosticSeverity::kError:
      return fmt::terminal_color::bright_red;
  }
  return fmt::terminal_color::white;
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  auto severity_string = GetSeverityString(diag.severity);
  if (diag.origin.empty()) {
    return fmt::format("{}: {}", severity_string, diag.message);
  }
  return fmt::format("{}: {}: {}", diag.origin, severity_string, diag.message);
}

void PrintDiagnostic(const Diagnostic& diag, bool colors) {
  if (!colors) {
    fmt::print(stderr, "{}\n", FormatDiagnostic(diag));
    return;
  }

  constexpr auto kOriginColor = fmt::terminal_color::cyan;

  if (!diag.origin.empty()) {
    fmt::print(stderr, "{}: ", fmt::styled(diag.origin, fmt::fg(kOriginColor)));
  }
  fmt::print(
      stderr, "{}: {}\n",
      fmt::styled(
          GetSeverityString(diag.severity),
          fmt::fg(GetSeverityColor(diag.severity))),
      fmt::styled(diag.message, fmt::emphasis::bold));
}

}  // namespace genarena

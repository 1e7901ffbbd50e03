#pragma once

#include <exception>
#include <expected>
#include <string>
#include <utility>

namespace genarena {

enum class DiagnosticSeverity { kWarning, kError };

struct Diagnostic {
  DiagnosticSeverity severity;
  // File (or other input name) the diagnostic refers to. May be empty.
  std::string origin;
  std::string message;

  static auto Error(std::string origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .severity = DiagnosticSeverity::kError,
        .origin = std::move(origin),
        .message = std::move(msg)};
  }

  static auto Warning(std::string origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .severity = DiagnosticSeverity::kWarning,
        .origin = std::move(origin),
        .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Render as "<origin>: <severity>: <message>"
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

// Print to stderr, optionally with terminal colors
void PrintDiagnostic(const Diagnostic& diag, bool colors = true);

}  // namespace genarena

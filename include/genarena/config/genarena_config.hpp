#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "genarena/arena_options.hpp"
#include "genarena/common/diagnostic.hpp"

namespace genarena::config {

inline constexpr std::string_view kConfigFileName = "genarena.toml";

struct LoggingConfig {
  spdlog::level::level_enum level = spdlog::level::info;
};

struct GenArenaConfig {
  ArenaOptions arena;
  LoggingConfig logging;

  // Unknown sections and keys. They do not stop the file from loading.
  std::vector<Diagnostic> warnings;

  // Directory where genarena.toml was found. Empty for parsed text.
  std::filesystem::path root_dir;
};

// Search for genarena.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse genarena.toml
// Throws DiagnosticException on parse errors or invalid values
auto LoadConfig(const std::filesystem::path& config_path) -> GenArenaConfig;

// Same as LoadConfig, reporting failure as a Diagnostic instead
auto TryLoadConfig(const std::filesystem::path& config_path)
    -> Result<GenArenaConfig>;

// Parse TOML text. origin names the input in diagnostics.
auto ParseConfig(std::string_view text, std::string_view origin = "<input>")
    -> GenArenaConfig;

// Set the default spdlog logger's level.
void ApplyLogging(const LoggingConfig& logging);

}  // namespace genarena::config

#include "genarena/config/genarena_config.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "genarena/arena.hpp"
#include "genarena/common/diagnostic.hpp"

namespace genarena::config {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ThrowConfigError(std::string_view origin, std::string msg) {
  throw DiagnosticException(
      Diagnostic::Error(std::string(origin), std::move(msg)));
}

// Returns the table at key, or nullptr if the section is absent.
auto GetSection(
    const toml::table& tbl, std::string_view key, std::string_view origin)
    -> const toml::table* {
  const auto* node = tbl.get(key);
  if (node == nullptr) {
    return nullptr;
  }
  const auto* section = node->as_table();
  if (section == nullptr) {
    ThrowConfigError(origin, fmt::format("'{}' must be a table", key));
  }
  return section;
}

// Records a warning for every key of tbl not listed in known.
void WarnUnknownKeys(
    const toml::table& tbl, std::string_view prefix,
    std::initializer_list<std::string_view> known, std::string_view origin,
    std::vector<Diagnostic>& warnings) {
  for (const auto& [key, node] : tbl) {
    std::string_view name = key.str();
    if (std::ranges::find(known, name) != known.end()) {
      continue;
    }
    auto message = prefix.empty()
                       ? fmt::format("unknown section '{}'", name)
                       : fmt::format("unknown key '{}.{}'", prefix, name);
    spdlog::warn("{}: {}", origin, message);
    warnings.push_back(
        Diagnostic::Warning(std::string(origin), std::move(message)));
  }
}

auto GetInteger(
    const toml::table& section, std::string_view section_name,
    std::string_view key, int64_t min, int64_t max, std::string_view origin)
    -> std::optional<int64_t> {
  const auto* node = section.get(key);
  if (node == nullptr) {
    return std::nullopt;
  }
  auto value = node->value_exact<int64_t>();
  if (!value) {
    ThrowConfigError(
        origin,
        fmt::format("'{}.{}' must be an integer", section_name, key));
  }
  if (*value < min || *value > max) {
    ThrowConfigError(
        origin, fmt::format(
                    "'{}.{}' = {} is out of range [{}, {}]", section_name,
                    key, *value, min, max));
  }
  return value;
}

void ReadArenaSection(
    const toml::table& tbl, std::string_view origin, GenArenaConfig& config) {
  const auto* arena = GetSection(tbl, "arena", origin);
  if (arena == nullptr) {
    return;
  }
  WarnUnknownKeys(
      *arena, "arena", {"initial_capacity", "max_generation"}, origin,
      config.warnings);

  auto& options = config.arena;

  if (auto capacity = GetInteger(
          *arena, "arena", "initial_capacity", 0,
          static_cast<int64_t>(detail::kMaxSlots), origin)) {
    options.initial_capacity = static_cast<size_t>(*capacity);
  }

  if (auto max_generation = GetInteger(
          *arena, "arena", "max_generation", 1, UINT32_MAX, origin)) {
    options.max_generation = static_cast<uint32_t>(*max_generation);
  }
}

void ReadLoggingSection(
    const toml::table& tbl, std::string_view origin, GenArenaConfig& config) {
  const auto* section = GetSection(tbl, "logging", origin);
  if (section == nullptr) {
    return;
  }
  WarnUnknownKeys(*section, "logging", {"level"}, origin, config.warnings);

  const auto* node = section->get("level");
  if (node == nullptr) {
    return;
  }
  auto name = node->value_exact<std::string>();
  if (!name) {
    ThrowConfigError(origin, "'logging.level' must be a string");
  }
  // from_str maps unknown names to off
  auto level = spdlog::level::from_str(*name);
  if (level == spdlog::level::off && *name != "off") {
    ThrowConfigError(
        origin, fmt::format("unknown log level '{}' in 'logging.level'", *name));
  }
  config.logging.level = level;
}

auto FromTable(const toml::table& tbl, std::string_view origin)
    -> GenArenaConfig {
  GenArenaConfig config;
  WarnUnknownKeys(tbl, "", {"arena", "logging"}, origin, config.warnings);
  ReadArenaSection(tbl, origin, config);
  ReadLoggingSection(tbl, origin, config);

  spdlog::debug(
      "config {}: initial_capacity={} max_generation={} log_level={}", origin,
      config.arena.initial_capacity, config.arena.max_generation,
      spdlog::level::to_string_view(config.logging.level));
  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> GenArenaConfig {
  std::string origin = config_path.string();

  toml::table tbl;
  try {
    tbl = toml::parse_file(origin);
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        origin, fmt::format("failed to parse {}: {}", origin, e.description()));
  }

  GenArenaConfig config = FromTable(tbl, origin);
  config.root_dir = config_path.parent_path();
  return config;
}

auto TryLoadConfig(const fs::path& config_path) -> Result<GenArenaConfig> {
  try {
    return LoadConfig(config_path);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto ParseConfig(std::string_view text, std::string_view origin)
    -> GenArenaConfig {
  toml::table tbl;
  try {
    tbl = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        origin, fmt::format("failed to parse {}: {}", origin, e.description()));
  }
  return FromTable(tbl, origin);
}

void ApplyLogging(const LoggingConfig& logging) {
  spdlog::set_level(logging.level);
}

}  // namespace genarena::config

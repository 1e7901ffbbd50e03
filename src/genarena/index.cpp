#include "genarena/index.hpp"

#include <string>

#include <fmt/core.h>

namespace genarena {

auto ToString(Index index) -> std::string {
  return fmt::format("{}", index);
}

}  // namespace genarena

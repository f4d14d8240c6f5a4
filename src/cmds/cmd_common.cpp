#include "cmd_common.h"

#include "registry.h"
#include "tui.h"

#include <stdexcept>

namespace forcegen {

std::unique_ptr<registry> load_registry(
    std::optional<std::filesystem::path> const &profiles_path) {
  if (!profiles_path) {
    tui::debug("Using builtin profiles");
    return registry::builtin();
  }

  if (!std::filesystem::exists(*profiles_path)) {
    throw std::runtime_error("profiles file does not exist: " + profiles_path->string());
  }
  if (std::filesystem::is_directory(*profiles_path)) {
    throw std::runtime_error("profiles path is a directory: " + profiles_path->string());
  }

  return registry::load(*profiles_path);
}

}  // namespace forcegen

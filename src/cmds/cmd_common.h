#pragma once

#include <filesystem>
#include <memory>
#include <optional>

namespace forcegen {

class registry;

// Load profiles from `profiles_path`, or the compiled-in catalog when unset.
std::unique_ptr<registry> load_registry(
    std::optional<std::filesystem::path> const &profiles_path);

}  // namespace forcegen

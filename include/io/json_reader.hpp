#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

namespace lazyserve::io {

// Throws std::runtime_error when the file cannot be read or is not an object.
nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace lazyserve::io

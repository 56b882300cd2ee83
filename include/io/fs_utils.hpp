#pragma once

#include <filesystem>
#include <set>

#include "core/context.hpp"

namespace lazyserve::io {

using Fingerprint = std::filesystem::file_time_type;

// Fingerprint of a tree without any (non-ignored) file.
inline const Fingerprint kNeverModified = Fingerprint::min();

std::filesystem::path normalizeIgnoredPath(const std::filesystem::path &path, const std::filesystem::path &base);

// Latest modification time among the regular files under `root`. Paths in
// `ignoredPaths` (absolute, normalized, exact match) are skipped and ignored
// directories are not entered. Unreadable entries are skipped.
Fingerprint computeFingerprint(
    const std::filesystem::path &root,
    const std::set<std::filesystem::path> &ignoredPaths,
    const lazyserve::Context &ctx
);

bool isPathInside(const std::filesystem::path &path, const std::filesystem::path &root);

} // namespace lazyserve::io

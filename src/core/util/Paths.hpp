#pragma once
#include <filesystem>

namespace fam {

// Absolute, symlink-resolved directory path without a trailing separator.
// Source directories are stored in the index in this form.
std::filesystem::path canonicalDir(const std::filesystem::path& dir);

} // namespace fam

#include "Paths.hpp"

namespace fam {

std::filesystem::path canonicalDir(const std::filesystem::path& dir) {
  namespace fs = std::filesystem;
  fs::path p = fs::weakly_canonical(fs::absolute(dir));
  if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
  return p;
}

} // namespace fam

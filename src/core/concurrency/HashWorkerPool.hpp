#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "core/hashing/Hasher.hpp"

namespace fam {

struct HashFailure {
  std::string reason;
  int         attempts = 1;
};

// One file's result: the fingerprint, or why it could not be produced.
struct HashOutcome {
  std::size_t                              index = 0;  // position in the submitted list
  std::filesystem::path                    path;
  std::variant<std::string, HashFailure>   result;

  bool ok() const { return std::holds_alternative<std::string>(result); }
  const std::string& fingerprint() const { return std::get<std::string>(result); }
  const HashFailure& failure() const { return std::get<HashFailure>(result); }
};

using HashSink = std::function<void(HashOutcome&&)>;

// Hashes `files` on a fixed pool of `workers` threads. Every worker runs the
// hasher's full retry cycle on one file at a time. `sink` runs on the calling
// thread, once per file, in completion order, as soon as each result lands.
// Returns after every file has been delivered. If `sink` throws, pending
// jobs are abandoned, the workers are joined and the exception propagates.
void hashInParallel(const Hasher& hasher,
                    const std::vector<std::filesystem::path>& files,
                    std::size_t workers,
                    const HashSink& sink);

// Same pool, but `sink` sees results in submission order: a result is held
// back until every earlier one has been delivered. With one worker the files
// are hashed inline on the calling thread.
void hashInOrder(const Hasher& hasher,
                 const std::vector<std::filesystem::path>& files,
                 std::size_t workers,
                 const HashSink& sink);

} // namespace fam

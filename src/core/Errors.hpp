#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fam {

// File could not be read after the hasher exhausted its attempts.
class ReadError : public std::runtime_error {
public:
  ReadError(const std::filesystem::path& path, int attempts, const std::string& cause)
    : std::runtime_error("read failed after " + std::to_string(attempts) +
                         " attempt(s): " + path.string() + ": " + cause),
      path_(path), attempts_(attempts), cause_(cause) {}

  const std::filesystem::path& path() const { return path_; }
  int attempts() const { return attempts_; }
  const std::string& cause() const { return cause_; }

private:
  std::filesystem::path path_;
  int attempts_;
  std::string cause_;
};

// Two different fingerprints resolved to the same archive name. Fatal.
class CollisionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A write to the index failed; the enclosing transaction is rolled back.
class IndexWriteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid or missing configuration, raised before any processing.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace fam

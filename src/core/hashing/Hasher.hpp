#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace fam {

struct RetryPolicy {
  int max_attempts = 6;                        // total attempts, first one included
  std::chrono::milliseconds base_delay{1000};  // doubled after every failed attempt
};

// SHA-256 hex digest of a file's contents, single attempt.
// Throws std::runtime_error on any open or read failure.
std::string sha256File(const std::filesystem::path& path);

class Hasher {
public:
  // Called before each backoff sleep with the attempt number that just failed.
  using RetryHook = std::function<void(const std::filesystem::path&, int attempt)>;

  explicit Hasher(RetryPolicy policy = {}, RetryHook onRetry = nullptr)
    : policy_(policy), onRetry_(std::move(onRetry)) {}

  // Fingerprint of the file, retrying transient failures with exponential
  // backoff. Throws ReadError once all attempts are used up.
  std::string hash(const std::filesystem::path& path) const;

  const RetryPolicy& policy() const { return policy_; }

private:
  RetryPolicy policy_;
  RetryHook onRetry_;
};

} // namespace fam

#include "HashWorkerPool.hpp"
#include "BlockingQueue.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

namespace fam {

namespace {

HashOutcome hashOne(const Hasher& hasher, std::size_t index, const std::filesystem::path& path) {
  HashOutcome out;
  out.index = index;
  out.path = path;
  try {
    out.result = hasher.hash(path);
  } catch (const ReadError& e) {
    out.result = HashFailure{e.cause(), e.attempts()};
  } catch (const std::exception& e) {
    out.result = HashFailure{e.what(), 1};
  }
  return out;
}

class ThreadJoiner {
public:
  explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
  ~ThreadJoiner() {
    for (auto& t : threads_) if (t.joinable()) t.join();
  }
private:
  std::vector<std::thread>& threads_;
};

} // namespace

void hashInParallel(const Hasher& hasher,
                    const std::vector<std::filesystem::path>& files,
                    std::size_t workers,
                    const HashSink& sink) {
  if (files.empty()) return;
  workers = std::max<std::size_t>(1, std::min(workers, files.size()));

  BlockingQueue<HashOutcome> results;
  std::atomic<std::size_t> cursor{0};
  std::atomic<bool> abandoned{false};
  std::atomic<std::size_t> running{workers};

  std::vector<std::thread> threads;
  threads.reserve(workers);
  ThreadJoiner joiner(threads);

  for (std::size_t w = 0; w < workers; ++w) {
    threads.emplace_back([&] {
      while (!abandoned) {
        const std::size_t i = cursor.fetch_add(1);
        if (i >= files.size()) break;
        results.push(hashOne(hasher, i, files[i]));
      }
      if (running.fetch_sub(1) == 1) results.close();
    });
  }

  try {
    while (auto outcome = results.pop()) sink(std::move(*outcome));
  } catch (...) {
    abandoned = true;
    throw;
  }
}

void hashInOrder(const Hasher& hasher,
                 const std::vector<std::filesystem::path>& files,
                 std::size_t workers,
                 const HashSink& sink) {
  if (workers <= 1) {
    for (std::size_t i = 0; i < files.size(); ++i) sink(hashOne(hasher, i, files[i]));
    return;
  }

  std::map<std::size_t, HashOutcome> pending;
  std::size_t nextIndex = 0;
  hashInParallel(hasher, files, workers, [&](HashOutcome&& outcome) {
    const std::size_t index = outcome.index;
    pending.emplace(index, std::move(outcome));
    for (auto it = pending.find(nextIndex); it != pending.end(); it = pending.find(nextIndex)) {
      sink(std::move(it->second));
      pending.erase(it);
      ++nextIndex;
    }
  });
}

} // namespace fam

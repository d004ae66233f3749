#pragma once

#include <thread>
#include <vector>

namespace rcache {
namespace utils {

// Joins every joinable thread in the borrowed vector when the scope ends,
// including when an exception unwinds it part way through spawning.
class JoinGuard {
public:
  explicit JoinGuard(std::vector<std::thread>& threads)
    : threads_(threads) {}

  ~JoinGuard() {
    join_all();
  }

  JoinGuard(const JoinGuard&) = delete;
  JoinGuard& operator=(const JoinGuard&) = delete;

  void join_all() {
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

private:
  std::vector<std::thread>& threads_;
};

} // namespace utils
} // namespace rcache

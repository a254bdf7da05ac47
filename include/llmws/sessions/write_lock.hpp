#pragma once

#include "llmws/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <memory>

namespace llmws::sessions {

constexpr std::chrono::milliseconds kDefaultLockTimeout{10'000};
constexpr std::chrono::milliseconds kStaleLockAge{30 * 60 * 1000};

/// Exclusive advisory lock on a transcript, held as `<file>.lock`.
///
/// The lock file records the owner's pid. A lock whose owner is gone, or which
/// is older than the stale age, is removed and taken over.
class SessionWriteLock {
public:
  /// Wraps a lock file this process has already created.
  explicit SessionWriteLock(std::filesystem::path lock_path);
  ~SessionWriteLock();

  SessionWriteLock(const SessionWriteLock &) = delete;
  SessionWriteLock &operator=(const SessionWriteLock &) = delete;

  [[nodiscard]] static common::Result<std::unique_ptr<SessionWriteLock>>
  acquire(const std::filesystem::path &session_file,
          std::chrono::milliseconds timeout = kDefaultLockTimeout,
          std::chrono::milliseconds stale_after = kStaleLockAge);

  /// Removes the lock file if it still belongs to this process.
  void release();

  [[nodiscard]] const std::filesystem::path &lock_path() const { return lock_path_; }

  [[nodiscard]] static std::filesystem::path lock_path_for(const std::filesystem::path &session_file);
  [[nodiscard]] static bool is_process_running(int pid);
  /// Removes `lock_path` when its owner is gone or it is older than
  /// `stale_after`. The lock is renamed aside and checked again before removal,
  /// so a lock re-created by another contender is never deleted.
  [[nodiscard]] static bool reclaim_stale(const std::filesystem::path &lock_path,
                                          std::chrono::milliseconds stale_after);

private:
  std::filesystem::path lock_path_;
  bool held_ = true;
};

} // namespace llmws::sessions

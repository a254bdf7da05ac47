#include "llmws/sessions/write_lock.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <optional>
#include <thread>

namespace llmws::sessions {

namespace {

constexpr auto kRetryInterval = std::chrono::milliseconds(50);

bool lock_is_stale(const std::filesystem::path &lock_path,
                   const std::chrono::milliseconds stale_after) {
  std::error_code ec;
  const auto modified = std::filesystem::last_write_time(lock_path, ec);
  if (ec) {
    return false;
  }
  const auto age = std::filesystem::file_time_type::clock::now() - modified;
  if (age > stale_after) {
    return true;
  }

  auto content = common::read_file(lock_path);
  if (!content.ok()) {
    return false;
  }
  auto parsed = common::json_parse_object(common::trim(content.value()));
  if (!parsed.ok()) {
    return false;
  }
  const auto pid = common::json_number_field(parsed.value(), "pid");
  return pid.has_value() && *pid > 0 &&
         !SessionWriteLock::is_process_running(static_cast<int>(*pid));
}

std::optional<long> lock_owner(const std::filesystem::path &lock_path) {
  auto content = common::read_file(lock_path);
  if (!content.ok()) {
    return std::nullopt;
  }
  auto parsed = common::json_parse_object(common::trim(content.value()));
  if (!parsed.ok()) {
    return std::nullopt;
  }
  const auto pid = common::json_number_field(parsed.value(), "pid");
  if (!pid.has_value()) {
    return std::nullopt;
  }
  return static_cast<long>(*pid);
}

} // namespace

SessionWriteLock::SessionWriteLock(std::filesystem::path lock_path)
    : lock_path_(std::move(lock_path)) {}

SessionWriteLock::~SessionWriteLock() { release(); }

std::filesystem::path SessionWriteLock::lock_path_for(const std::filesystem::path &session_file) {
  return std::filesystem::path(session_file.string() + ".lock");
}

common::Result<std::unique_ptr<SessionWriteLock>>
SessionWriteLock::acquire(const std::filesystem::path &session_file,
                          const std::chrono::milliseconds timeout,
                          const std::chrono::milliseconds stale_after) {
  using Out = common::Result<std::unique_ptr<SessionWriteLock>>;
  const std::filesystem::path lock_path = lock_path_for(session_file);

  std::error_code ec;
  if (lock_path.has_parent_path()) {
    std::filesystem::create_directories(lock_path.parent_path(), ec);
    if (ec) {
      return Out::failure("failed to create session directory: " + ec.message());
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const int fd = ::open(lock_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      const std::string body = "{\"pid\":" + std::to_string(getpid()) +
                               ",\"createdAt\":" + common::json_quote(common::now_iso8601()) +
                               "}\n";
      const ssize_t written = ::write(fd, body.data(), body.size());
      const int write_errno = errno;
      ::close(fd);
      if (written != static_cast<ssize_t>(body.size())) {
        std::filesystem::remove(lock_path, ec);
        return Out::failure("failed to write session lock " + lock_path.string() + ": " +
                            std::strerror(write_errno));
      }
      return Out::success(std::make_unique<SessionWriteLock>(lock_path));
    }
    if (errno != EEXIST) {
      return Out::failure("failed to create session lock " + lock_path.string() + ": " +
                          std::strerror(errno));
    }

    if (reclaim_stale(lock_path, stale_after)) {
      continue;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return Out::failure("session file locked (timeout " + std::to_string(timeout.count()) +
                          "ms): " + lock_path.string());
    }
    std::this_thread::sleep_for(kRetryInterval);
  }
}

bool SessionWriteLock::reclaim_stale(const std::filesystem::path &lock_path,
                                     const std::chrono::milliseconds stale_after) {
  if (!lock_is_stale(lock_path, stale_after)) {
    return false;
  }
  // Only one contender can rename the lock away; the loser sees ENOENT.
  static std::atomic<unsigned> sequence{0};
  const std::filesystem::path aside(lock_path.string() + ".stale." + std::to_string(getpid()) +
                                    "." + std::to_string(sequence.fetch_add(1)));
  if (::rename(lock_path.c_str(), aside.c_str()) != 0) {
    return false;
  }
  std::error_code ec;
  if (lock_is_stale(aside, stale_after)) {
    std::filesystem::remove(aside, ec);
    return true;
  }
  // A fresh lock replaced the stale one before the rename. Put it back unless
  // yet another lock has appeared meanwhile.
  if (::link(aside.c_str(), lock_path.c_str()) != 0) {
    observability::log_warn("sessions", "could not restore session lock " + lock_path.string() +
                                            ": " + std::strerror(errno));
  }
  std::filesystem::remove(aside, ec);
  return false;
}

void SessionWriteLock::release() {
  if (!held_) {
    return;
  }
  held_ = false;
  // A lock taken over by another process is theirs now.
  if (lock_owner(lock_path_) != std::optional<long>(static_cast<long>(getpid()))) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(lock_path_, ec);
}

bool SessionWriteLock::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace llmws::sessions

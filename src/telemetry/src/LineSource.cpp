/**
 * @file LineSource.cpp
 * @brief Implementation of the child-process line source.
 */

#include "src/telemetry/inc/LineSource.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <exception>
#include <thread>
#include <utility>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t READ_CHUNK = 4096;

/// Wait for a child that already closed its stdout before signalling it.
constexpr std::chrono::milliseconds EXIT_GRACE{250};

void closeFd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Report errno to the parent through the CLOEXEC error pipe, then exit.
[[noreturn]] void childFail(int errFd) noexcept {
  const int ERR = errno;
  ssize_t n = 0;
  do {
    n = ::write(errFd, &ERR, sizeof(ERR));
  } while (n < 0 && errno == EINTR);
  ::_exit(127);
}

} // namespace

/* ----------------------------- toString ----------------------------- */

const char* toString(SourceStatus status) noexcept {
  switch (status) {
  case SourceStatus::OK:
    return "ok";
  case SourceStatus::INVALID_ARGUMENT:
    return "invalid argument";
  case SourceStatus::SPAWN_FAILED:
    return "spawn failed";
  case SourceStatus::NOT_FOUND:
    return "executable not found";
  }
  return "unknown";
}

const char* toString(ReadStatus status) noexcept {
  switch (status) {
  case ReadStatus::LINE:
    return "line";
  case ReadStatus::TIMEOUT:
    return "timeout";
  case ReadStatus::END:
    return "end";
  }
  return "unknown";
}

/* ----------------------------- ProcessLineSource ----------------------------- */

ProcessLineSource::ProcessLineSource(std::vector<std::string> argv,
                                     std::size_t discardLeadingLines)
    : argv_(std::move(argv)), discardLeading_(discardLeadingLines) {}

ProcessLineSource::~ProcessLineSource() { close(); }

std::string ProcessLineSource::describe() const {
  std::string out;
  for (const std::string& arg : argv_) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

SourceStatus ProcessLineSource::open() noexcept {
  if (argv_.empty() || argv_.front().empty()) {
    return SourceStatus::INVALID_ARGUMENT;
  }
  close();

  // Build argv before fork: the child may only make async-signal-safe calls
  std::vector<char*> cargv;
  try {
    cargv.reserve(argv_.size() + 1);
  } catch (const std::exception&) {
    return SourceStatus::SPAWN_FAILED;
  }
  for (std::string& arg : argv_) {
    cargv.push_back(arg.data());
  }
  cargv.push_back(nullptr);

  std::array<int, 2> out{-1, -1};
  std::array<int, 2> err{-1, -1};
  if (::pipe2(out.data(), O_CLOEXEC) != 0) {
    return SourceStatus::SPAWN_FAILED;
  }
  if (::pipe2(err.data(), O_CLOEXEC) != 0) {
    closeFd(out[0]);
    closeFd(out[1]);
    return SourceStatus::SPAWN_FAILED;
  }

  const pid_t CHILD = ::fork();
  if (CHILD < 0) {
    closeFd(out[0]);
    closeFd(out[1]);
    closeFd(err[0]);
    closeFd(err[1]);
    return SourceStatus::SPAWN_FAILED;
  }

  if (CHILD == 0) {
    if (::dup2(out[1], STDOUT_FILENO) < 0) {
      childFail(err[1]);
    }
    const int DEVNULL = ::open("/dev/null", O_WRONLY);
    if (DEVNULL >= 0) {
      ::dup2(DEVNULL, STDERR_FILENO);
    }
    ::execvp(cargv[0], cargv.data());
    childFail(err[1]);
  }

  closeFd(out[1]);
  closeFd(err[1]);

  // Blocks until exec succeeds (EOF via CLOEXEC) or the child reports errno
  int childErrno = 0;
  ssize_t n = 0;
  do {
    n = ::read(err[0], &childErrno, sizeof(childErrno));
  } while (n < 0 && errno == EINTR);
  closeFd(err[0]);

  pid_ = CHILD;
  if (n == static_cast<ssize_t>(sizeof(childErrno))) {
    closeFd(out[0]);
    reap();
    return (childErrno == ENOENT) ? SourceStatus::NOT_FOUND : SourceStatus::SPAWN_FAILED;
  }

  fd_ = out[0];
  eof_ = false;
  overlong_ = false;
  discarded_ = 0;
  buffer_.clear();
  return SourceStatus::OK;
}

bool ProcessLineSource::takeLine(std::string& line) {
  while (true) {
    const std::size_t NL = buffer_.find('\n');
    if (NL == std::string::npos) {
      return false;
    }
    if (overlong_) {
      buffer_.erase(0, NL + 1);
      overlong_ = false;
      continue;
    }
    std::string next = buffer_.substr(0, NL);
    buffer_.erase(0, NL + 1);
    if (!next.empty() && next.back() == '\r') {
      next.pop_back();
    }
    if (discarded_ < discardLeading_) {
      ++discarded_;
      continue;
    }
    line = std::move(next);
    return true;
  }
}

ReadStatus ProcessLineSource::readLine(std::string& line, std::chrono::milliseconds timeout) {
  if (takeLine(line)) {
    return ReadStatus::LINE;
  }
  if (fd_ < 0 || eof_) {
    // Flush an unterminated final line once
    if (!buffer_.empty() && !overlong_ && discarded_ >= discardLeading_) {
      line = std::move(buffer_);
      buffer_.clear();
      return ReadStatus::LINE;
    }
    return ReadStatus::END;
  }

  const Clock::time_point DEADLINE = Clock::now() + timeout;
  std::array<char, READ_CHUNK> chunk{};

  while (true) {
    const auto REMAINING =
        std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - Clock::now());
    const int WAIT_MS = REMAINING.count() > 0 ? static_cast<int>(REMAINING.count()) : 0;

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int READY = ::poll(&pfd, 1, WAIT_MS);
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      eof_ = true;
      return readLine(line, std::chrono::milliseconds{0});
    }
    if (READY == 0) {
      return ReadStatus::TIMEOUT;
    }

    const ssize_t N = ::read(fd_, chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      eof_ = true;
      return readLine(line, std::chrono::milliseconds{0});
    }
    if (N == 0) {
      eof_ = true;
      return readLine(line, std::chrono::milliseconds{0});
    }

    buffer_.append(chunk.data(), static_cast<std::size_t>(N));
    if (takeLine(line)) {
      return ReadStatus::LINE;
    }
    if (buffer_.size() > MAX_LINE_BYTES) {
      buffer_.clear();
      overlong_ = true;
    }
  }
}

void ProcessLineSource::reap() noexcept {
  if (pid_ <= 0) {
    return;
  }

  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);

  // Child closed stdout on its own: give it a moment to exit normally
  if (r == 0 && eof_) {
    const Clock::time_point EXIT_DEADLINE = Clock::now() + EXIT_GRACE;
    while ((r = ::waitpid(pid_, &status, WNOHANG)) == 0 && Clock::now() < EXIT_DEADLINE) {
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
  }

  if (r == 0) {
    ::kill(pid_, SIGTERM);
    const Clock::time_point DEADLINE = Clock::now() + TERM_GRACE;
    while ((r = ::waitpid(pid_, &status, WNOHANG)) == 0 && Clock::now() < DEADLINE) {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    if (r == 0) {
      ::kill(pid_, SIGKILL);
      do {
        r = ::waitpid(pid_, &status, 0);
      } while (r < 0 && errno == EINTR);
    }
  }

  exitStatus_ = (r == pid_) ? status : 0;
  pid_ = -1;
}

void ProcessLineSource::close() noexcept {
  closeFd(fd_);
  reap();
  eof_ = true;
}

} // namespace telemetry

} // namespace poolscope

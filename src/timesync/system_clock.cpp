#include "bathycat/timesync/system_clock.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "bathycat/common/errors.hpp"

namespace bathycat::timesync {

namespace {

inline std::string sys_err(const std::string& msg) {
  return msg + ": " + std::strerror(errno);
}

constexpr const char* kTimedatectl = "timedatectl";

}  // namespace

// ----------------------------------------------------------- PosixSystemClock

WallTime PosixSystemClock::now() const {
  struct timespec ts{};
  if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    throw TimeSyncError(sys_err("clock_gettime failed"));
  }
  using namespace std::chrono;
  return WallTime(duration_cast<WallClock::duration>(seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec)));
}

void PosixSystemClock::set(WallTime t) {
  using namespace std::chrono;
  const auto ns = duration_cast<nanoseconds>(t.time_since_epoch()).count();
  struct timespec ts{};
  ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
  ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
  if (clock_settime(CLOCK_REALTIME, &ts) != 0) {
    if (errno == EPERM) {
      throw TimeSyncError("clock_settime refused: missing CAP_SYS_TIME");
    }
    throw TimeSyncError(sys_err("clock_settime failed"));
  }
}

// --------------------------------------------------------- TimedatectlService

TimedatectlService::TimedatectlService(std::chrono::milliseconds command_timeout)
  : command_timeout_(command_timeout) {}

bool TimedatectlService::is_active() {
  std::string out = run({"show", "-p", "NTP", "--value"});
  while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) out.pop_back();
  if (out == "yes") return true;
  if (out == "no") return false;
  throw TimeSyncError("unexpected timedatectl NTP state '" + out + "'");
}

void TimedatectlService::set_active(bool active) {
  run({"set-ntp", active ? "true" : "false"});
}

std::string TimedatectlService::run(const std::vector<std::string>& args) {
  int pipefd[2];
  if (::pipe2(pipefd, O_CLOEXEC) != 0) {
    throw TimeSyncError(sys_err("pipe failed"));
  }

  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(kTimedatectl));
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    throw TimeSyncError(sys_err("fork failed"));
  }
  if (pid == 0) {
    ::dup2(pipefd[1], STDOUT_FILENO);
    const int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
    ::execvp(kTimedatectl, argv.data());
    ::_exit(127);
  }
  ::close(pipefd[1]);

  std::string out;
  const auto deadline = SteadyClock::now() + command_timeout_;
  bool timed_out = false;
  char buf[256];
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }
    struct pollfd pfd{};
    pfd.fd = pipefd[0];
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) {
      timed_out = (rc == 0);
      break;
    }
    const ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;  // EOF: child closed stdout
    out.append(buf, static_cast<std::size_t>(n));
  }
  ::close(pipefd[0]);

  if (timed_out) {
    ::kill(pid, SIGKILL);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  if (timed_out) {
    throw TimeSyncError("timedatectl timed out");
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw TimeSyncError("timedatectl " + args.front() + " exited with status " +
                        std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
  }
  return out;
}

}  // namespace bathycat::timesync

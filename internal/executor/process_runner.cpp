#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

namespace blockforge::executor {

namespace {

void SetRlimit(int resource, rlim_t value) {
  struct rlimit rl;
  rl.rlim_cur = value;
  rl.rlim_max = value;
  (void)setrlimit(resource, &rl);
}

void SetNonBlocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void ClosePair(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
}

struct Capture {
  int          fd = -1;
  std::string* out;
  bool*        truncated;
  bool         eof = false;
};

// Reads whatever is available without blocking. Bytes past the cap are discarded.
void Drain(Capture& capture, std::size_t max_bytes) {
  char buf[4096];
  while (!capture.eof) {
    const ssize_t n = read(capture.fd, buf, sizeof(buf));
    if (n > 0) {
      const std::size_t room = max_bytes > capture.out->size() ? max_bytes - capture.out->size() : 0;
      std::size_t       take = static_cast<std::size_t>(n);
      if (take > room) {
        take                = room;
        *capture.truncated = true;
      }
      capture.out->append(buf, take);
      continue;
    }
    if (n == 0) {
      capture.eof = true;
      break;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) capture.eof = true;
    break;
  }
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv, const std::string& cwd, const ProcessLimits& limits, int stdout_fd,
                            int stderr_fd, int error_fd) {
  (void)dup2(stdout_fd, STDOUT_FILENO);
  (void)dup2(stderr_fd, STDERR_FILENO);

  const int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    (void)dup2(devnull, STDIN_FILENO);
  }

  // own process group so a timeout kills every descendant
  (void)setpgid(0, 0);
  (void)umask(077);

  long maxfd = sysconf(_SC_OPEN_MAX);
  if (maxfd < 256) maxfd = 256;
  for (int fd = 3; fd < maxfd; ++fd) {
    if (fd != error_fd) (void)close(fd);
  }

  if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
    const int err = errno;
    (void)write(error_fd, &err, sizeof(err));
    _exit(127);
  }

  unsetenv("LD_PRELOAD");
  unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
  if (limits.no_new_privs) {
    (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
  }
  (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

  if (limits.rlimit_cpu_sec > 0) SetRlimit(RLIMIT_CPU, static_cast<rlim_t>(limits.rlimit_cpu_sec));
  if (limits.rlimit_as_mb > 0) SetRlimit(RLIMIT_AS, static_cast<rlim_t>(limits.rlimit_as_mb) * 1024ULL * 1024ULL);
  if (limits.rlimit_nofile > 0) SetRlimit(RLIMIT_NOFILE, static_cast<rlim_t>(limits.rlimit_nofile));

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
  cargv.push_back(nullptr);

  execvp(cargv[0], cargv.data());

  // error_fd is close-on-exec, so the parent only sees this on exec failure
  const int err = errno;
  (void)write(error_fd, &err, sizeof(err));
  _exit(127);
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const std::string& cwd, const ProcessLimits& limits) {
  ProcessResult result;
  if (argv.empty() || argv[0].empty()) {
    result.error = "empty argv";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    ClosePair(exec_pipe);
    return result;
  }

  const auto start = std::chrono::steady_clock::now();

  const pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    ClosePair(exec_pipe);
    return result;
  }

  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    close(exec_pipe[0]);
    ExecChild(argv, cwd, limits, out_pipe[1], err_pipe[1], exec_pipe[1]);
  }

  // parent
  (void)setpgid(pid, pid);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(exec_pipe[1]);

  int     exec_errno = 0;
  ssize_t exec_n     = 0;
  do {
    exec_n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (exec_n < 0 && errno == EINTR);
  close(exec_pipe[0]);

  if (exec_n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close(out_pipe[0]);
    close(err_pipe[0]);
    result.error = "cannot start " + argv[0] + ": " + std::strerror(exec_errno);
    return result;
  }
  result.started = true;

  SetNonBlocking(out_pipe[0]);
  SetNonBlocking(err_pipe[0]);

  Capture stdout_capture{out_pipe[0], &result.stdout_data, &result.stdout_truncated};
  Capture stderr_capture{err_pipe[0], &result.stderr_data, &result.stderr_truncated};

  int  status       = 0;
  bool child_exited = false;

  while (true) {
    Drain(stdout_capture, limits.max_output_bytes);
    Drain(stderr_capture, limits.max_output_bytes);

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      child_exited = true;
      break;
    }

    const auto elapsed_ms =
        static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    if (limits.timeout_ms > 0 && elapsed_ms >= limits.timeout_ms) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      child_exited = true;
      break;
    }

    struct pollfd fds[2];
    nfds_t        nfds = 0;
    if (!stdout_capture.eof) fds[nfds++] = {stdout_capture.fd, POLLIN, 0};
    if (!stderr_capture.eof) fds[nfds++] = {stderr_capture.fd, POLLIN, 0};

    int slice = 50;
    if (limits.timeout_ms > 0) {
      slice = std::max(1, std::min(slice, limits.timeout_ms - elapsed_ms));
    }
    if (nfds > 0) {
      (void)poll(fds, nfds, slice);
    } else {
      (void)poll(nullptr, 0, slice);
    }
  }

  // output written just before exit
  Drain(stdout_capture, limits.max_output_bytes);
  Drain(stderr_capture, limits.max_output_bytes);
  close(out_pipe[0]);
  close(err_pipe[0]);

  result.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  if (!child_exited) {
    result.exit_code = 128;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = 128;
  }
  return result;
}

} // namespace blockforge::executor

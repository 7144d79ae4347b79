#include "shell.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace provy {
namespace {

constexpr char kShellPath[]{ "/bin/sh" };
constexpr int kExecFailedExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr std::size_t kReadChunk{ 4096 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

// Owns a file descriptor; closed on destruction.
class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_{ fd } {}
  ~unique_fd() { reset(); }

  unique_fd(unique_fd const &) = delete;
  unique_fd &operator=(unique_fd const &) = delete;
  unique_fd(unique_fd &&other) noexcept : fd_{ std::exchange(other.fd_, -1) } {}
  unique_fd &operator=(unique_fd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ != -1; }

  void reset() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{ -1 };
};

struct pipe_ends {
  unique_fd read;
  unique_fd write;
};

// Both ends are close-on-exec; the child only keeps what it dup2's onto 0/1/2.
pipe_ends make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) { throw_errno("pipe failed"); }
  pipe_ends ends{ unique_fd{ fds[0] }, unique_fd{ fds[1] } };
  for (int const fd : fds) {
    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) { throw_errno("fcntl failed"); }
  }
  return ends;
}

class line_splitter {
 public:
  explicit line_splitter(std::function<void(std::string_view)> const &on_line)
      : on_line_{ on_line } {}

  void feed(char const *data, std::size_t size) {
    pending_.append(data, size);
    std::size_t start{ 0 };
    for (std::size_t nl; (nl = pending_.find('\n', start)) != std::string::npos;
         start = nl + 1) {
      emit(std::string_view{ pending_ }.substr(start, nl - start));
    }
    pending_.erase(0, start);
  }

  void finish() {
    if (!pending_.empty()) { emit(pending_); }
    pending_.clear();
  }

 private:
  void emit(std::string_view line) {
    if (on_line_) { on_line_(line); }
  }

  std::function<void(std::string_view)> const &on_line_;
  std::string pending_;
};

// Reads both pipes until each reports EOF.
void pump(unique_fd &out, unique_fd &err, shell_run_cfg const &cfg) {
  std::array<line_splitter, 2> splitters{ line_splitter{ cfg.on_stdout_line },
                                          line_splitter{ cfg.on_stderr_line } };
  std::array<unique_fd *, 2> const fds{ &out, &err };
  std::array<char, kReadChunk> chunk{};

  while (*fds[0] || *fds[1]) {
    std::array<pollfd, 2> polled{};
    for (std::size_t i{ 0 }; i < fds.size(); ++i) {
      polled[i] = pollfd{ .fd = fds[i]->get(), .events = POLLIN, .revents = 0 };
    }

    if (::poll(polled.data(), polled.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll failed");
    }

    for (std::size_t i{ 0 }; i < fds.size(); ++i) {
      if (!*fds[i] || polled[i].revents == 0) { continue; }
      if (polled[i].revents & POLLNVAL) { throw std::runtime_error("poll: invalid pipe"); }

      ssize_t const n{ ::read(fds[i]->get(), chunk.data(), chunk.size()) };
      if (n == -1) {
        if (errno == EINTR) { continue; }
        throw_errno("read failed");
      }
      if (n == 0) {
        splitters[i].finish();
        fds[i]->reset();
        continue;
      }
      splitters[i].feed(chunk.data(), static_cast<std::size_t>(n));
    }
  }
}

shell_result reap(pid_t child) {
  int status{ 0 };
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) { throw_errno("waitpid failed"); }
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }
  return { .exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : status,
           .signal = std::nullopt };
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int stdout_fd,
                             int stderr_fd,
                             char *const *argv,
                             char *const *envp) {
  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1 ||
      ::dup2(stdout_fd, STDOUT_FILENO) == -1 || ::dup2(stderr_fd, STDERR_FILENO) == -1) {
    _exit(kExecFailedExit);
  }

  ::execve(kShellPath, argv, envp);

  char const msg[]{ "provy: failed to exec /bin/sh\n" };
  ssize_t const ignored{ ::write(STDERR_FILENO, msg, sizeof msg - 1) };
  (void)ignored;
  _exit(kExecFailedExit);
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  for (char **entry{ environ }; entry && *entry; ++entry) {
    std::string_view const kv{ *entry };
    if (auto const eq{ kv.find('=') }; eq != std::string_view::npos) {
      env.insert_or_assign(std::string{ kv.substr(0, eq) }, std::string{ kv.substr(eq + 1) });
    }
  }
  return env;
}

shell_result shell_run(std::string_view command, shell_run_cfg const &cfg) {
  // Everything the child needs is allocated before fork.
  std::string command_str{ command };
  std::string shell_str{ kShellPath };
  std::string flag_str{ "-c" };
  std::array<char *, 4> argv{ shell_str.data(), flag_str.data(), command_str.data(), nullptr };

  std::vector<std::string> env_strings;
  env_strings.reserve(cfg.env.size());
  for (auto const &[name, value] : cfg.env) { env_strings.push_back(name + "=" + value); }
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &entry : env_strings) { envp.push_back(entry.data()); }
  envp.push_back(nullptr);

  auto out{ make_pipe() };
  auto err{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) { throw_errno("fork failed"); }
  if (child == 0) { exec_child(out.write.get(), err.write.get(), argv.data(), envp.data()); }

  out.write.reset();
  err.write.reset();

  try {
    pump(out.read, err.read, cfg);
  } catch (...) {
    ::kill(child, SIGKILL);
    reap(child);
    throw;
  }

  return reap(child);
}

}  // namespace provy

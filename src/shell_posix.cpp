#if defined(_WIN32)
#error "shell_posix.cpp should not be compiled on Windows builds"
#else

#include "shell.h"

#include "util.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace shipit {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr size_t kReadChunkSize{ 4096 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

// Owns a file descriptor; closes it on destruction or reset().
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
  bool valid() const { return fd_ != -1; }

  void reset() {
    if (fd_ == -1) { return; }
    while (::close(fd_) == -1 && errno == EINTR) {}
    fd_ = -1;
  }

 private:
  int fd_{ -1 };
};

struct pipe_pair {
  unique_fd read_end;
  unique_fd write_end;
};

pipe_pair make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) { throw_errno("pipe failed"); }
  return { unique_fd{ fds[0] }, unique_fd{ fds[1] } };
}

// "KEY=value" strings plus the null-terminated pointer array execve wants.
class env_block : unmovable {
 public:
  explicit env_block(shell_env_t const &env) {
    entries_.reserve(env.size());
    for (auto const &[key, value] : env) { entries_.push_back(key + "=" + value); }
    pointers_.reserve(entries_.size() + 1);
    for (auto &entry : entries_) { pointers_.push_back(entry.data()); }
    pointers_.push_back(nullptr);
  }

  char **envp() { return pointers_.data(); }

 private:
  std::vector<std::string> entries_;
  std::vector<char *> pointers_;
};

std::vector<std::string> shell_argv(shell_choice choice) {
  switch (choice) {
    case shell_choice::bash:
      if (char const *bash_env{ ::getenv("BASH") }) { return { bash_env }; }
      return { "/usr/bin/env", "bash" };
    case shell_choice::sh: return { "/bin/sh" };
  }
  throw std::invalid_argument("shell_run: unsupported shell choice");
}

void write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t const written{ ::write(fd, data.data(), data.size()) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("write failed");
    }
    data.remove_prefix(static_cast<size_t>(written));
  }
}

// Writes script to a private, owner-executable temp file and returns its path.
std::filesystem::path write_temp_script(std::string_view script) {
  std::string pattern{
    (std::filesystem::temp_directory_path() / "shipit-shell-XXXXXX").string()
  };

  unique_fd fd{ ::mkstemp(pattern.data()) };
  if (!fd.valid()) { throw_errno("mkstemp failed"); }

  try {
    write_all(fd.get(), script);
    if (!script.empty() && script.back() != '\n') { write_all(fd.get(), "\n"); }

    if (::fchmod(fd.get(), S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
      throw_errno("fchmod failed");
    }
  } catch (std::system_error const &) {
    std::error_code ec;
    std::filesystem::remove(pattern, ec);
    throw;
  }

  return pattern;
}

// Accumulates bytes from one child stream and hands out complete lines.
class line_reader {
 public:
  line_reader(unique_fd fd, std::function<void(std::string_view)> const &on_stream_line)
      : fd_{ std::move(fd) }, on_stream_line_{ on_stream_line } {}

  int fd() const { return fd_.get(); }
  bool open() const { return fd_.valid(); }

  // Reads what is available; closes the descriptor at EOF.
  void pump(std::string &chunk,
            std::function<void(std::string_view)> const &on_any_line) {
    ssize_t const n{ ::read(fd_.get(), chunk.data(), chunk.size()) };
    if (n == -1) {
      if (errno == EINTR) { return; }
      throw_errno("read failed");
    }

    if (n == 0) {
      if (!pending_.empty()) { emit(pending_, on_any_line); }
      pending_.clear();
      fd_.reset();
      return;
    }

    pending_.append(chunk.data(), static_cast<size_t>(n));

    size_t start{ 0 };
    for (size_t nl; (nl = pending_.find('\n', start)) != std::string::npos; start = nl + 1) {
      emit(std::string_view{ pending_ }.substr(start, nl - start), on_any_line);
    }
    pending_.erase(0, start);
  }

 private:
  void emit(std::string_view line,
            std::function<void(std::string_view)> const &on_any_line) const {
    if (on_stream_line_) { on_stream_line_(line); }
    if (on_any_line) { on_any_line(line); }
  }

  unique_fd fd_;
  std::function<void(std::string_view)> const &on_stream_line_;
  std::string pending_;
};

void drain_child_output(line_reader &out, line_reader &err, shell_run_cfg const &cfg) {
  std::array<line_reader *, 2> const readers{ &out, &err };
  std::string chunk(kReadChunkSize, '\0');

  while (out.open() || err.open()) {
    std::array<pollfd, 2> fds{};
    for (size_t i{ 0 }; i < readers.size(); ++i) {
      fds[i].fd = readers[i]->open() ? readers[i]->fd() : -1;
      fds[i].events = POLLIN;
    }

    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll failed");
    }

    for (size_t i{ 0 }; i < readers.size(); ++i) {
      if (!readers[i]->open() || fds[i].revents == 0) { continue; }
      if (fds[i].revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }
      readers[i]->pump(chunk, cfg.on_output_line);
    }
  }
}

shell_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) { throw_errno("waitpid failed"); }
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }
  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }
  return { .exit_code = status, .signal = std::nullopt };
}

// Child side of fork(). Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(std::optional<std::filesystem::path> const &cwd,
                             std::vector<char *> const &argv,
                             char **envp) {
  if (cwd && ::chdir(cwd->c_str()) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  ::execve(argv[0], argv.data(), envp);
  std::perror("execve");
  _exit(kChildErrorExit);
}

void redirect_or_die(int src, int dst, char const *what) {
  if (::dup2(src, dst) == -1) {
    std::perror(what);
    _exit(kChildErrorExit);
  }
}

pid_t spawn(std::vector<std::string> const &argv_strings,
            shell_run_cfg const &cfg,
            char **envp,
            pipe_pair *out,
            pipe_pair *err) {
  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  std::fflush(stdout);
  std::fflush(stderr);

  pid_t const child{ ::fork() };
  if (child == -1) { throw_errno("fork failed"); }
  if (child != 0) { return child; }

  if (out && err) {
    if (!cfg.inherit_stdin) {
      int const null_fd{ ::open("/dev/null", O_RDONLY) };
      if (null_fd == -1) {
        std::perror("open /dev/null");
        _exit(kChildErrorExit);
      }
      redirect_or_die(null_fd, STDIN_FILENO, "dup2 stdin");
      ::close(null_fd);
    }
    redirect_or_die(out->write_end.get(), STDOUT_FILENO, "dup2 stdout");
    redirect_or_die(err->write_end.get(), STDERR_FILENO, "dup2 stderr");
    ::close(out->read_end.get());
    ::close(err->read_end.get());
    ::close(out->write_end.get());
    ::close(err->write_end.get());
  }

  exec_child(cfg.cwd, argv, envp);
}

shell_result run_piped(std::vector<std::string> const &argv,
                       shell_run_cfg const &cfg,
                       char **envp) {
  auto out{ make_pipe() };
  auto err{ make_pipe() };

  pid_t const child{ spawn(argv, cfg, envp, &out, &err) };

  out.write_end.reset();
  err.write_end.reset();

  try {
    line_reader out_reader{ std::move(out.read_end), cfg.on_stdout_line };
    line_reader err_reader{ std::move(err.read_end), cfg.on_stderr_line };
    drain_child_output(out_reader, err_reader, cfg);
  } catch (...) {
    ::kill(child, SIGKILL);
    static_cast<void>(wait_for_child(child));
    throw;
  }

  return wait_for_child(child);
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view const kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env.insert_or_assign(std::string{ kv.substr(0, sep) }, std::string{ kv.substr(sep + 1) });
  }

  return env;
}

shell_result process_run(std::vector<std::string> const &argv, shell_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: argv must be non-empty"); }

  env_block env{ cfg.env };

  if (cfg.interactive) {
    return wait_for_child(spawn(argv, cfg, env.envp(), nullptr, nullptr));
  }
  return run_piped(argv, cfg, env.envp());
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  scoped_path_cleanup const script_file{ write_temp_script(script) };

  auto argv{ shell_argv(cfg.shell) };
  argv.push_back(script_file.path().string());

  return process_run(argv, cfg);
}

}  // namespace shipit

#endif  // POSIX implementation

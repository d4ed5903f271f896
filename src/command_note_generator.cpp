#include "command_note_generator.hpp"
#include "logging.hpp"
#include "posix_fd.hpp"
#include "text_util.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>

static constexpr size_t kMaxOutput = 1 << 20;

static const char* search_arg(SearchMode m) {
  switch (m) {
    case SearchMode::Auto: return "auto";
    case SearchMode::Provider: return "tavily";
    case SearchMode::Offline: return "off";
  }
  return "auto";
}

CommandNoteGenerator::CommandNoteGenerator(std::string command, int timeout_sec)
  : command_(std::move(command)), timeout_sec_(timeout_sec < 1 ? 1 : timeout_sec) {}

std::vector<std::string> CommandNoteGenerator::build_argv(const std::string& term, const GenerateOptions& opts) const {
  std::vector<std::string> args;
  std::istringstream iss(command_);
  std::string a;
  while (iss >> a) args.push_back(a);
  if (args.empty()) return args;
  args.push_back("--search");
  args.push_back(search_arg(opts.search));
  if (opts.plain) args.push_back("--plain");
  args.push_back(term);
  return args;
}

GenerationError CommandNoteGenerator::classify_exit(int code) {
  if (code == 0) return GenerationError::None;
  if (code == 77) return GenerationError::AuthFailure;      // EX_NOPERM
  if (code == 69 || code == 75) return GenerationError::NetworkFailure; // EX_UNAVAILABLE, EX_TEMPFAIL
  return GenerationError::ProviderError;
}

static std::string last_line(const std::string& s) {
  std::string t = trim(s);
  size_t pos = t.rfind('\n');
  return pos == std::string::npos ? t : t.substr(pos + 1);
}

Generation CommandNoteGenerator::explain(const WordEntry& entry, const GenerateOptions& opts) const {
  std::vector<std::string> args = build_argv(entry.term, opts);
  if (args.empty()) return Generation::failure(GenerationError::ProviderError, "ai_command is empty");
  // argv is built before fork; the child only calls async-signal-safe functions
  std::vector<char*> argv;
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);

  UniqueFd out_r, out_w, err_r, err_w;
  if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w)) {
    return Generation::failure(GenerationError::ProviderError, "pipe failed");
  }
  pid_t pid = ::fork();
  if (pid < 0) return Generation::failure(GenerationError::ProviderError, "fork failed");
  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, 0);
    ::dup2(out_w.get(), 1);
    ::dup2(err_w.get(), 2);
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }
  out_w.reset();
  err_w.reset();
  WT_LOGD("AI", "spawned pid=%d for '%s'", static_cast<int>(pid), entry.term.c_str());

  std::string out, err;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec_);
  bool timed_out = false;
  char buf[4096];
  while (out_r.valid() || err_r.valid()) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) { timed_out = true; break; }
    pollfd fds[2];
    int n = 0;
    UniqueFd* owners[2];
    if (out_r.valid()) { fds[n] = {out_r.get(), POLLIN, 0}; owners[n++] = &out_r; }
    if (err_r.valid()) { fds[n] = {err_r.get(), POLLIN, 0}; owners[n++] = &err_r; }
    int rc = ::poll(fds, static_cast<nfds_t>(n), static_cast<int>(left));
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < n; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
      if (r <= 0) { owners[i]->reset(); continue; }
      std::string& dst = (owners[i] == &out_r) ? out : err;
      if (dst.size() < kMaxOutput) dst.append(buf, static_cast<size_t>(r));
    }
  }

  if (timed_out) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
    WT_LOGW("AI", "timeout after %ds for '%s'", timeout_sec_, entry.term.c_str());
    return Generation::failure(GenerationError::Timeout, "no answer after " + std::to_string(timeout_sec_) + "s");
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return Generation::failure(GenerationError::ProviderError, "waitpid failed");
  }
  if (WIFSIGNALED(status)) {
    return Generation::failure(GenerationError::ProviderError, "killed by signal " + std::to_string(WTERMSIG(status)));
  }
  int code = WIFEXITED(status) ? WEXITSTATUS(status) : 1;
  if (code == 127) {
    return Generation::failure(GenerationError::ProviderError, "can not run: " + args[0]);
  }
  GenerationError kind = classify_exit(code);
  if (kind != GenerationError::None) {
    std::string why = last_line(err);
    if (why.empty()) why = "exit status " + std::to_string(code);
    return Generation::failure(kind, why);
  }
  if (trim(out).empty()) return Generation::failure(GenerationError::ProviderError, "empty output");
  if (opts.plain) out = strip_markdown_headings(out);
  return Generation::success(std::move(out));
}

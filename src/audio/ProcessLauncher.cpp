#include "mpvdeck/audio/ProcessLauncher.hpp"
#include "mpvdeck/errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <rclcpp/rclcpp.hpp>

namespace deck_audio {

namespace {

rclcpp::Logger launcherLogger(){
  return rclcpp::get_logger("ProcessLauncher");
}

void set_cloexec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

} // namespace

// --- ProcessHandle ----------------------------------------------------------

ProcessHandle::ProcessHandle(pid_t pid, std::string program,
                             std::chrono::milliseconds poll_interval,
                             std::chrono::milliseconds term_grace)
: child_pid_(pid), program_(std::move(program)),
  poll_interval_(poll_interval), term_grace_(term_grace) {}

ProcessHandle::~ProcessHandle() {
  terminate();
}

int ProcessHandle::decodeStatus(int status){
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

bool ProcessHandle::reap(bool block, int& status){
  for(;;){
    pid_t r = waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    if(r == child_pid_) return true;
    if(r == 0) return false;
    if(errno == EINTR) continue;
    // ECHILD: somebody else reaped it, nothing left to wait for.
    RCLCPP_ERROR(launcherLogger(), "waitpid(%d) failed: %s", child_pid_, std::strerror(errno));
    status = -1;
    return true;
  }
}

std::optional<int> ProcessHandle::wait(const KeepRunning& keep_running){
  if(exit_status_) return exit_status_;
  if(child_pid_ <= 0) return std::nullopt;

  int status = 0;
  while(!reap(false, status)){
    if(keep_running && !keep_running()) return std::nullopt;
    std::this_thread::sleep_for(poll_interval_);
  }
  exit_status_ = status == -1 ? -1 : decodeStatus(status);
  RCLCPP_DEBUG(launcherLogger(), "%s (pid=%d) exited with %d",
               program_.c_str(), child_pid_, *exit_status_);
  child_pid_ = -1;
  return exit_status_;
}

void ProcessHandle::terminate(){
  if(child_pid_ <= 0) return;

  int status = 0;
  bool reaped = false;
  if(kill(child_pid_, SIGTERM) == 0){
    auto deadline = std::chrono::steady_clock::now() + term_grace_;
    while(!(reaped = reap(false, status)) && std::chrono::steady_clock::now() < deadline){
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
  if(!reaped){
    kill(child_pid_, SIGKILL);
    reap(true, status);
  }
  exit_status_ = status == -1 ? -1 : decodeStatus(status);
  RCLCPP_INFO(launcherLogger(), "Playback stopped (pid=%d)", child_pid_);
  child_pid_ = -1;
}

// --- ProcessLauncher --------------------------------------------------------

ProcessLauncher::ProcessLauncher(PlayerCommand cmd)
: cmd_(std::move(cmd)) {}

std::unique_ptr<ProcessHandle> ProcessLauncher::spawnPlayer(const std::string& program,
                                                            const std::vector<std::string>& args,
                                                            const std::string& filepath,
                                                            int& exec_errno){
  exec_errno = 0;

  int status_pipe[2];  // child writes errno here if execvp fails
  if(pipe(status_pipe) < 0){
    throw mpvdeck::PlayerLaunchFailure(std::string("pipe() failed: ") + std::strerror(errno));
  }
  set_cloexec(status_pipe[0]);
  set_cloexec(status_pipe[1]);

  std::vector<std::string> argv_s;
  argv_s.reserve(args.size() + 2);
  argv_s.push_back(program);
  argv_s.insert(argv_s.end(), args.begin(), args.end());
  argv_s.push_back(filepath);
  std::vector<char*> argv;
  for(auto& a : argv_s) argv.push_back(a.data());
  argv.push_back(nullptr);

  pid_t pid = fork();
  if(pid < 0){
    int err = errno;
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    throw mpvdeck::PlayerLaunchFailure(std::string("fork() failed: ") + std::strerror(err));
  }

  if(pid == 0){
    ::close(status_pipe[0]);
    execvp(program.c_str(), argv.data());
    int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  ::close(status_pipe[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while(n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if(n == static_cast<ssize_t>(sizeof(child_errno))){
    // exec failed: the child is about to _exit(127), reap it now.
    int st = 0;
    while(waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    exec_errno = child_errno;
    return nullptr;
  }

  RCLCPP_INFO(launcherLogger(), "Playing: %s (%s, pid=%d)",
              filepath.c_str(), program.c_str(), pid);
  return std::make_unique<ProcessHandle>(pid, program, cmd_.poll_interval, cmd_.term_grace);
}

std::unique_ptr<PlaybackHandle> ProcessLauncher::launch(const std::string& filepath){
  std::vector<std::string> candidates{cmd_.program};
  candidates.insert(candidates.end(), cmd_.fallbacks.begin(), cmd_.fallbacks.end());

  std::string last_error;
  for(std::size_t i = 0; i < candidates.size(); ++i){
    const auto& program = candidates[i];
    int exec_errno = 0;
    // player_args belong to the primary player only.
    static const std::vector<std::string> kNoArgs;
    const auto& args = i == 0 ? cmd_.args : kNoArgs;
    auto handle = spawnPlayer(program, args, filepath, exec_errno);
    if(handle) return handle;

    last_error = "cannot execute '" + program + "': " + std::strerror(exec_errno);
    // Fallbacks only replace a missing player, never a broken one.
    if(exec_errno != ENOENT) break;
    if(i + 1 < candidates.size()){
      RCLCPP_WARN(launcherLogger(), "%s, trying '%s'",
                  last_error.c_str(), candidates[i + 1].c_str());
    }
  }
  RCLCPP_ERROR(launcherLogger(), "%s", last_error.c_str());
  throw mpvdeck::PlayerLaunchFailure(last_error);
}

} // namespace deck_audio

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#include "mpvdeck/audio/PlayerLauncher.hpp"

namespace deck_audio {

/**
 * @brief Player invocation settings.
 */
struct PlayerCommand {
  std::string program{"mpv"};                 ///< Executable, looked up in PATH.
  std::vector<std::string> args;              ///< Primary player only, placed before the file path.
  std::vector<std::string> fallbacks;         ///< Tried only if @c program is missing, get no @c args.
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds term_grace{1500};
};

/**
 * @brief Handle of a forked player process.
 */
class ProcessHandle : public PlaybackHandle {
public:
  ProcessHandle(pid_t pid, std::string program,
                std::chrono::milliseconds poll_interval,
                std::chrono::milliseconds term_grace);
  ~ProcessHandle() override;

  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  std::optional<int> wait(const KeepRunning& keep_running) override;
  void terminate() override;
  bool finished() const override { return child_pid_ <= 0; }

  pid_t pid() const { return child_pid_; }
  const std::string& program() const { return program_; }

  /**
   * @brief Convert a waitpid() status into a shell-like exit code.
   * @param status Raw status.
   * @return Exit code, or 128 + signal number for a killed child.
   */
  static int decodeStatus(int status);

private:
  bool reap(bool block, int& status);

  pid_t child_pid_{-1};
  std::string program_;
  std::chrono::milliseconds poll_interval_;
  std::chrono::milliseconds term_grace_;
  std::optional<int> exit_status_;
};

/**
 * @brief Spawns the external media player with fork()/execvp().
 *
 * The child inherits the terminal so the player keeps its own keyboard
 * controls. A close-on-exec pipe reports exec failures back to the parent,
 * so a missing executable surfaces as PlayerLaunchFailure instead of an
 * exit status of 127.
 */
class ProcessLauncher : public PlayerLauncher {
public:
  /**
   * @brief Construct a new ProcessLauncher.
   * @param cmd Player program, arguments and timing.
   */
  explicit ProcessLauncher(PlayerCommand cmd = {});

  std::unique_ptr<PlaybackHandle> launch(const std::string& filepath) override;

  const PlayerCommand& command() const { return cmd_; }

private:
  /**
   * @brief Fork and exec one candidate program.
   * @param program Executable name or path.
   * @param args Arguments placed before the file path.
   * @param filepath Path to audio file.
   * @param exec_errno Receives errno of a failed exec, 0 otherwise.
   * @return Handle if the exec succeeded.
   */
  std::unique_ptr<ProcessHandle> spawnPlayer(const std::string& program,
                                             const std::vector<std::string>& args,
                                             const std::string& filepath,
                                             int& exec_errno);

  PlayerCommand cmd_;
};

} // namespace deck_audio

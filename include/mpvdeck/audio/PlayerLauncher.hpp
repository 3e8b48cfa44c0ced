#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace deck_audio {

/**
 * @brief Predicate polled while a player runs; false requests cancellation.
 */
using KeepRunning = std::function<bool()>;

/**
 * @brief One running external player bound to exactly one file.
 *
 * The handle owns the child process. Destroying it terminates and reaps a
 * child that is still alive.
 */
class PlaybackHandle {
public:
  /**
   * @brief Virtual destructor for proper cleanup.
   */
  virtual ~PlaybackHandle() = default;

  /**
   * @brief Block until the player exits.
   * @param keep_running Polled while waiting. Returning false aborts the wait.
   * @return Exit status, or nullopt if the wait was cancelled while the
   *         player was still running.
   */
  virtual std::optional<int> wait(const KeepRunning& keep_running) = 0;

  /**
   * @brief Ask the player to stop and reap it. Safe to call repeatedly.
   */
  virtual void terminate() = 0;

  /** @brief Whether the child has been reaped. */
  virtual bool finished() const = 0;
};

/**
 * @brief Capability to start the external player for a file.
 *
 * The real implementation spawns `mpv`; tests substitute a double that never
 * creates processes.
 */
class PlayerLauncher {
public:
  virtual ~PlayerLauncher() = default;

  /**
   * @brief Start playback of one file.
   * @param filepath File handed to the player as last argument.
   * @return Owned handle of the running player.
   * @throws mpvdeck::PlayerLaunchFailure if the player cannot be started.
   */
  virtual std::unique_ptr<PlaybackHandle> launch(const std::string& filepath) = 0;
};

} // namespace deck_audio

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mpvdeck/audio/PlayerLauncher.hpp"
#include "mpvdeck/library/Library.hpp"
#include "mpvdeck/session/Selection.hpp"

namespace deck_session {

/**
 * @brief Explicit session configuration.
 *
 * Directories are resolved once by the caller; the session never looks at
 * the process working directory.
 */
struct SessionConfig {
  std::string music_dir;                ///< Shuffle source.
  std::string base_dir;                 ///< List source and default search root.
  std::vector<std::string> extensions;  ///< Extension filter, empty = all files.
  std::size_t max_tracks{0};            ///< Continuous play limit, 0 = unlimited.
  unsigned int seed{0};                 ///< Random seed, 0 = std::random_device.
};

/**
 * @brief Result of a finished session.
 */
struct SessionResult {
  std::size_t tracks_played{0};     ///< Players started and waited on.
  bool interrupted{false};          ///< Stopped by keep_running().
  std::optional<int> last_status;   ///< Exit status of the last player, if any.
};

/**
 * @brief Directory driven playback session.
 *
 * The session snapshots a library once, selects files with a policy and
 * hands them to the external player one at a time. It never holds more than
 * one running player: the next file starts only after the previous handle was
 * waited on. When @c keep_running turns false the running player is
 * terminated before the session returns.
 */
class PlaybackSession {
public:
  using NowPlaying = std::function<void(const std::string&)>;
  using Chooser = std::function<std::size_t(const deck_library::Library&)>;

  /**
   * @brief Construct a session.
   * @param config Directories, filters and limits.
   * @param launcher Player capability, must outlive the session.
   * @param keep_running Cancellation predicate, polled during playback.
   */
  PlaybackSession(SessionConfig config, deck_audio::PlayerLauncher& launcher,
                  deck_audio::KeepRunning keep_running);

  /** @brief Callback invoked with each path right after its player started. */
  void setNowPlaying(NowPlaying cb) { now_playing_ = std::move(cb); }

  /**
   * @brief Play one file and wait for the player.
   * @param filepath File to play.
   * @return Exit status, or nullopt when interrupted during playback.
   * @throws mpvdeck::PlayerLaunchFailure if the player cannot be started.
   */
  std::optional<int> play(const std::string& filepath);

  /**
   * @brief Shuffle (RANDOM over music_dir) or list (SEQUENTIAL over base_dir)
   *        playback until interrupted.
   * @param policy SEQUENTIAL or RANDOM.
   * @throws mpvdeck::EmptyLibrary when the directory has no files.
   */
  SessionResult runContinuous(SelectionPolicy policy);

  /**
   * @brief Continuous playback over an already enumerated library.
   */
  SessionResult runContinuous(const deck_library::Library& library, SelectionPolicy policy);

  /**
   * @brief Search, let @p chooser pick one match, play it once.
   * @param term Case-insensitive filename substring.
   * @param directory Search root, empty = base_dir.
   * @param chooser Returns a 1-based index into the matches.
   * @throws mpvdeck::EmptyLibrary when nothing matches.
   * @throws mpvdeck::InvalidSelection when the pick is out of range.
   */
  SessionResult runSearch(const std::string& term, const std::string& directory,
                          const Chooser& chooser);

  /** @brief Whether a player is currently owned by the session. */
  bool isPlaying() const { return current_ != nullptr; }

  const SessionConfig& config() const { return config_; }

private:
  deck_library::LibraryQuery makeQuery(const std::string& dir, bool recursive,
                                       const std::string& term) const;
  bool keepRunning() const;

  SessionConfig config_;
  deck_audio::PlayerLauncher& launcher_;
  deck_audio::KeepRunning keep_running_;
  NowPlaying now_playing_;
  RandomEngine rng_;
  std::unique_ptr<deck_audio::PlaybackHandle> current_;
};

} // namespace deck_session

#pragma once

#include <stdexcept>
#include <string>

namespace mpvdeck {

/**
 * @brief Base class of every error a playback session reports.
 *
 * All of them are fatal for the session: they are caught once by the
 * console node, shown to the user and mapped to exit status 1.
 */
class PlaybackError : public std::runtime_error {
public:
  explicit PlaybackError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief No playable file was found (empty directory or no match). */
class EmptyLibrary : public PlaybackError {
public:
  explicit EmptyLibrary(const std::string& what) : PlaybackError(what) {}
};

/** @brief User input is non-numeric or outside [1, count]. */
class InvalidSelection : public PlaybackError {
public:
  explicit InvalidSelection(const std::string& what) : PlaybackError(what) {}
};

/** @brief The external player could not be spawned. */
class PlayerLaunchFailure : public PlaybackError {
public:
  explicit PlayerLaunchFailure(const std::string& what) : PlaybackError(what) {}
};

} // namespace mpvdeck

#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "mpvdeck/library/Library.hpp"

namespace deck_ui {

/**
 * @brief Entries of the mode menu, numbered as shown to the user.
 */
enum class PlayMode : int { SHUFFLE=1, LIST=2, SEARCH=3 };

/**
 * @brief Answers to the search prompts.
 */
struct SearchRequest {
  std::string term;
  std::string directory;  ///< Empty when the user left it blank.
};

/**
 * @brief Line based console prompts.
 *
 * ConsoleMenu prints the mode menu, the search prompts and the numbered
 * match listing, and reads the answers from a stream. It does no playback
 * itself.
 */
class ConsoleMenu {
public:
  /**
   * @brief Construct a menu over the given streams.
   * @param in Source of user answers.
   * @param out Destination of prompts and listings.
   */
  ConsoleMenu(std::istream& in, std::ostream& out);

  /**
   * @brief Show the mode menu until a valid choice is entered.
   * @return Selected mode, or nullopt on end of input.
   */
  std::optional<PlayMode> promptMode();

  /**
   * @brief Ask for the search term and the search directory.
   * @return Answers, or nullopt on end of input.
   */
  std::optional<SearchRequest> promptSearch();

  /**
   * @brief List the matches numbered from 1 and read the user's pick.
   * @param matches Search results.
   * @return 1-based index.
   * @throws mpvdeck::InvalidSelection for non-numeric, out of range or missing input.
   */
  std::size_t chooseMatch(const deck_library::Library& matches);

  /** @brief Announce the file handed to the player. */
  void showPlaying(const std::string& path);

  /** @brief Print an error line for the user. */
  void showError(const std::string& message);

  /**
   * @brief Print a prompt and read one line.
   * @param prompt Text shown without trailing newline.
   * @return Line without terminator, or nullopt on end of input.
   */
  std::optional<std::string> readLine(const std::string& prompt);

private:
  std::istream& in_;
  std::ostream& out_;
};

} // namespace deck_ui

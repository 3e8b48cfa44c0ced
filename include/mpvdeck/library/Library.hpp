#pragma once

#include <string>
#include <vector>

namespace deck_library {

/**
 * @brief Ordered snapshot of playable file paths for one session.
 *
 * The vector is filled once and never re-read from disk while the session
 * runs. Positions are addressed 1-based by the selection policies.
 */
using Library = std::vector<std::string>;

/**
 * @brief Parameters of a directory listing.
 */
struct LibraryQuery {
  std::string directory;                ///< Directory to list.
  bool recursive{false};                ///< Walk sub-directories too.
  std::string filter_term;              ///< Case-insensitive filename substring.
  std::vector<std::string> extensions;  ///< Allowed suffixes (".mp3"), empty = all.
};

/**
 * @brief List the files selected by a query.
 *
 * Flat listings keep regular, non-hidden files sorted by name. Recursive
 * listings keep every regular file below the directory sorted by path and
 * filtered by @p query.filter_term against the base filename.
 *
 * @param query Listing parameters.
 * @return Non-empty library.
 * @throws mpvdeck::EmptyLibrary when nothing matches or the directory is unusable.
 */
Library enumerate(const LibraryQuery& query);

/** @brief Convenience overload without extension filter. */
Library enumerate(const std::string& directory, bool recursive,
                  const std::string& filter_term = "");

/**
 * @brief Keep entries whose base filename contains @p term, ignoring case.
 * @param library Source entries, order preserved.
 * @param term Substring to look for. Empty matches everything.
 * @return Filtered copy.
 */
Library filterByName(const Library& library, const std::string& term);

/**
 * @brief Convert string to lowercase for case-insensitive matching.
 * @param s Input string.
 * @return Lowercase copy.
 */
std::string toLower(std::string s);

} // namespace deck_library

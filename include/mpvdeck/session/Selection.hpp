#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <utility>

#include "mpvdeck/library/Library.hpp"

namespace deck_session {

/**
 * @brief Rule that decides which library entry plays next.
 */
enum class SelectionPolicy {
  SEQUENTIAL,  ///< 1..N, then wraps to 1.
  RANDOM,      ///< Uniform draw over [1, N], repeats allowed.
  SEARCH_PICK  ///< One explicit user-chosen index, never repeats.
};

/**
 * @brief Cursor state threaded through selectNext().
 *
 * Indices are 1-based like the numbered listing shown to the user.
 */
struct SelectionState {
  std::size_t cursor{1};   ///< Next sequential position.
  std::size_t picked{0};   ///< Chosen index for SEARCH_PICK, 0 = none.
  bool consumed{false};    ///< SEARCH_PICK already delivered its file.
};

/**
 * @brief Pseudo random engine owned by a session.
 */
using RandomEngine = std::mt19937;

/**
 * @brief Select the next file of a library.
 *
 * SEQUENTIAL returns the entry at the cursor and advances it, wrapping to 1
 * once the cursor runs past the end. RANDOM ignores the cursor and draws a
 * fresh index each call. SEARCH_PICK returns the picked entry once.
 *
 * @param library Non-empty snapshot.
 * @param policy Selection rule.
 * @param state Current state (not modified).
 * @param rng Engine used by RANDOM.
 * @return Selected path and the state to use for the following call.
 * @throws mpvdeck::EmptyLibrary if @p library is empty.
 * @throws mpvdeck::InvalidSelection for a missing, out of range or consumed pick.
 */
std::pair<std::string, SelectionState> selectNext(const deck_library::Library& library,
                                                  SelectionPolicy policy,
                                                  const SelectionState& state,
                                                  RandomEngine& rng);

/**
 * @brief Parse the numeric answer to "Enter the number of the file...".
 * @param text Raw user input.
 * @param count Number of listed matches.
 * @return 1-based index in [1, count].
 * @throws mpvdeck::InvalidSelection when non-numeric or out of range.
 */
std::size_t parseSelection(const std::string& text, std::size_t count);

/** @brief Human readable policy name for logs. */
const char* policyName(SelectionPolicy policy);

} // namespace deck_session

#include "mpvdeck/session/Selection.hpp"
#include "mpvdeck/errors.hpp"

#include <algorithm>
#include <cctype>

namespace deck_session {

std::pair<std::string, SelectionState> selectNext(const deck_library::Library& library,
                                                  SelectionPolicy policy,
                                                  const SelectionState& state,
                                                  RandomEngine& rng){
  const std::size_t n = library.size();
  if(n == 0) throw mpvdeck::EmptyLibrary("Nothing to select from an empty library.");

  SelectionState next = state;
  switch(policy){
    case SelectionPolicy::SEQUENTIAL: {
      // Cursor past the end restarts the list.
      std::size_t idx = (state.cursor < 1 || state.cursor > n) ? 1 : state.cursor;
      next.cursor = idx + 1;
      return {library[idx - 1], next};
    }
    case SelectionPolicy::RANDOM: {
      std::uniform_int_distribution<std::size_t> dist(1, n);
      std::size_t idx = dist(rng);
      return {library[idx - 1], next};
    }
    case SelectionPolicy::SEARCH_PICK: {
      if(state.consumed)
        throw mpvdeck::InvalidSelection("Selection already played.");
      if(state.picked < 1 || state.picked > n)
        throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");
      next.consumed = true;
      return {library[state.picked - 1], next};
    }
  }
  throw mpvdeck::InvalidSelection("Unknown selection policy.");
}

std::size_t parseSelection(const std::string& text, std::size_t count){
  auto first = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c){ return std::isspace(c); });
  auto last = std::find_if_not(text.rbegin(), text.rend(),
                               [](unsigned char c){ return std::isspace(c); }).base();
  if(first >= last) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");

  std::string digits(first, last);
  bool numeric = std::all_of(digits.begin(), digits.end(),
                             [](unsigned char c){ return std::isdigit(c); });
  if(!numeric) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");

  // Strip leading zeros so overlong input cannot overflow.
  auto nz = digits.find_first_not_of('0');
  if(nz == std::string::npos) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");
  digits.erase(0, nz);
  if(digits.size() > 18) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");

  std::size_t value = static_cast<std::size_t>(std::stoull(digits));
  if(value < 1 || value > count) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");
  return value;
}

const char* policyName(SelectionPolicy policy){
  switch(policy){
    case SelectionPolicy::SEQUENTIAL:  return "sequential";
    case SelectionPolicy::RANDOM:      return "random";
    case SelectionPolicy::SEARCH_PICK: return "search-pick";
  }
  return "unknown";
}

} // namespace deck_session

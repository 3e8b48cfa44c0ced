#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "mpvdeck/errors.hpp"
#include "mpvdeck/session/Selection.hpp"

namespace deck_session {
namespace {

deck_library::Library makeLibrary(std::size_t n){
  deck_library::Library lib;
  for(std::size_t i = 1; i <= n; ++i) lib.push_back("track" + std::to_string(i) + ".mp3");
  return lib;
}

TEST(SelectionTest, SequentialVisitsInOrderThenWraps) {
  RandomEngine rng(1);
  for(std::size_t n = 1; n <= 6; ++n){
    auto lib = makeLibrary(n);
    SelectionState state;
    std::string first;
    for(std::size_t call = 1; call <= n + 1; ++call){
      auto [path, next] = selectNext(lib, SelectionPolicy::SEQUENTIAL, state, rng);
      if(call == 1) first = path;
      if(call <= n) EXPECT_EQ(path, lib[call - 1]) << "n=" << n << " call=" << call;
      else EXPECT_EQ(path, first) << "n=" << n;
      state = next;
    }
  }
}

TEST(SelectionTest, SequentialDoesNotModifyInputState) {
  RandomEngine rng(1);
  auto lib = makeLibrary(3);
  SelectionState state;
  auto result = selectNext(lib, SelectionPolicy::SEQUENTIAL, state, rng);
  EXPECT_EQ(state.cursor, 1u);
  EXPECT_EQ(result.second.cursor, 2u);
}

TEST(SelectionTest, RandomStaysInRangeAndReachesEveryEntry) {
  RandomEngine rng(42);
  auto lib = makeLibrary(7);
  std::set<std::string> seen;
  SelectionState state;
  for(int i = 0; i < 2000; ++i){
    auto [path, next] = selectNext(lib, SelectionPolicy::RANDOM, state, rng);
    ASSERT_NE(std::find(lib.begin(), lib.end(), path), lib.end());
    seen.insert(path);
    state = next;
  }
  EXPECT_EQ(seen.size(), lib.size());
}

TEST(SelectionTest, RandomOnSingleEntryAlwaysRepeats) {
  RandomEngine rng(7);
  auto lib = makeLibrary(1);
  for(int i = 0; i < 10; ++i){
    EXPECT_EQ(selectNext(lib, SelectionPolicy::RANDOM, {}, rng).first, lib[0]);
  }
}

TEST(SelectionTest, SearchPickReturnsChosenEntryOnce) {
  RandomEngine rng(1);
  deck_library::Library filtered{"song.mp3", "Song2.wav"};
  SelectionState state;
  state.picked = 1;
  auto [path, next] = selectNext(filtered, SelectionPolicy::SEARCH_PICK, state, rng);
  EXPECT_EQ(path, "song.mp3");
  EXPECT_TRUE(next.consumed);
  EXPECT_THROW(selectNext(filtered, SelectionPolicy::SEARCH_PICK, next, rng),
               mpvdeck::InvalidSelection);
}

TEST(SelectionTest, SearchPickOutOfRangeIsInvalid) {
  RandomEngine rng(1);
  deck_library::Library filtered{"song.mp3", "Song2.wav"};
  SelectionState state;
  state.picked = 3;
  EXPECT_THROW(selectNext(filtered, SelectionPolicy::SEARCH_PICK, state, rng),
               mpvdeck::InvalidSelection);
  state.picked = 0;
  EXPECT_THROW(selectNext(filtered, SelectionPolicy::SEARCH_PICK, state, rng),
               mpvdeck::InvalidSelection);
}

TEST(SelectionTest, EmptyLibraryIsRejected) {
  RandomEngine rng(1);
  deck_library::Library empty;
  EXPECT_THROW(selectNext(empty, SelectionPolicy::SEQUENTIAL, {}, rng), mpvdeck::EmptyLibrary);
  EXPECT_THROW(selectNext(empty, SelectionPolicy::RANDOM, {}, rng), mpvdeck::EmptyLibrary);
}

TEST(SelectionTest, ParseSelectionAcceptsDigitsInRange) {
  EXPECT_EQ(parseSelection("1", 2), 1u);
  EXPECT_EQ(parseSelection(" 2 \n", 2), 2u);
  EXPECT_EQ(parseSelection("02", 2), 2u);
}

TEST(SelectionTest, ParseSelectionRejectsBadInput) {
  for(const char* bad : {"0", "3", "abc", "", "  ", "-1", "+1", "1.0", "1a",
                         "99999999999999999999999999"}){
    EXPECT_THROW(parseSelection(bad, 2), mpvdeck::InvalidSelection) << "input '" << bad << "'";
  }
}

TEST(SelectionTest, PolicyNames) {
  EXPECT_STREQ(policyName(SelectionPolicy::SEQUENTIAL), "sequential");
  EXPECT_STREQ(policyName(SelectionPolicy::RANDOM), "random");
  EXPECT_STREQ(policyName(SelectionPolicy::SEARCH_PICK), "search-pick");
}

} // namespace
} // namespace deck_session

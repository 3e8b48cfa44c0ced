#include <gtest/gtest.h>

#include <sstream>

#include "mpvdeck/errors.hpp"
#include "mpvdeck/ui/ConsoleMenu.hpp"

namespace deck_ui {
namespace {

TEST(ConsoleMenuTest, InvalidChoiceRepromptsUntilValid) {
  std::istringstream in("9\nabc\n2\n");
  std::ostringstream out;
  ConsoleMenu menu(in, out);

  auto mode = menu.promptMode();
  ASSERT_TRUE(mode.has_value());
  EXPECT_EQ(*mode, PlayMode::LIST);

  const std::string text = out.str();
  EXPECT_NE(text.find("1: Shuffle Play\n2: List Play\n3: Search\n"), std::string::npos);
  std::size_t invalid = 0;
  for(auto pos = text.find("Invalid choice. Please try again."); pos != std::string::npos;
      pos = text.find("Invalid choice. Please try again.", pos + 1)) ++invalid;
  EXPECT_EQ(invalid, 2u);
}

TEST(ConsoleMenuTest, ModeChoicesMapToModes) {
  for(auto [answer, expected] : {std::pair{"1", PlayMode::SHUFFLE},
                                 std::pair{" 3 ", PlayMode::SEARCH}}){
    std::istringstream in(std::string(answer) + "\n");
    std::ostringstream out;
    EXPECT_EQ(ConsoleMenu(in, out).promptMode(), expected);
  }
}

TEST(ConsoleMenuTest, EndOfInputEndsMenu) {
  std::istringstream in("");
  std::ostringstream out;
  ConsoleMenu menu(in, out);
  EXPECT_FALSE(menu.promptMode().has_value());
}

TEST(ConsoleMenuTest, SearchPromptsKeepTermAndBlankDirectory) {
  std::istringstream in("Bohemian Rhapsody\n   \n");
  std::ostringstream out;
  ConsoleMenu menu(in, out);
  auto req = menu.promptSearch();
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->term, "Bohemian Rhapsody");
  EXPECT_TRUE(req->directory.empty());
  EXPECT_NE(out.str().find("Enter Song Name: "), std::string::npos);
  EXPECT_NE(out.str().find("(leave blank for current directory)"), std::string::npos);
}

TEST(ConsoleMenuTest, SearchTermIsTrimmed) {
  std::istringstream in("  song \n\n");
  std::ostringstream out;
  auto req = ConsoleMenu(in, out).promptSearch();
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->term, "song");
}

TEST(ConsoleMenuTest, SearchPromptHandlesCrLf) {
  std::istringstream in("song\r\n/music\r\n");
  std::ostringstream out;
  auto req = ConsoleMenu(in, out).promptSearch();
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->term, "song");
  EXPECT_EQ(req->directory, "/music");
}

TEST(ConsoleMenuTest, ChooseMatchListsNumberedEntries) {
  std::istringstream in("2\n");
  std::ostringstream out;
  ConsoleMenu menu(in, out);
  EXPECT_EQ(menu.chooseMatch({"./song.mp3", "./Song2.wav"}), 2u);
  EXPECT_NE(out.str().find("Found the following files:\n1: ./song.mp3\n2: ./Song2.wav\n"),
            std::string::npos);
}

TEST(ConsoleMenuTest, ChooseMatchRejectsBadAnswers) {
  for(const char* answer : {"3\n", "0\n", "abc\n", ""}){
    std::istringstream in(answer);
    std::ostringstream out;
    ConsoleMenu menu(in, out);
    EXPECT_THROW(menu.chooseMatch({"a.mp3", "b.mp3"}), mpvdeck::InvalidSelection)
        << "answer '" << answer << "'";
  }
}

} // namespace
} // namespace deck_ui

#include "mpvdeck/ui/ConsoleMenu.hpp"
#include "mpvdeck/errors.hpp"
#include "mpvdeck/session/Selection.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace deck_ui {

namespace {

std::string trim(const std::string& s){
  auto first = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c){ return std::isspace(c); });
  auto last = std::find_if_not(s.rbegin(), s.rend(),
                               [](unsigned char c){ return std::isspace(c); }).base();
  return first < last ? std::string(first, last) : std::string();
}

} // namespace

ConsoleMenu::ConsoleMenu(std::istream& in, std::ostream& out)
  : in_(in), out_(out) {}

std::optional<std::string> ConsoleMenu::readLine(const std::string& prompt){
  out_ << prompt << std::flush;
  std::string line;
  if(!std::getline(in_, line)){
    out_ << "\n";
    return std::nullopt;
  }
  if(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

std::optional<PlayMode> ConsoleMenu::promptMode(){
  for(;;){
    out_ << "1: Shuffle Play\n"
         << "2: List Play\n"
         << "3: Search\n";
    auto answer = readLine("Enter your choice: ");
    if(!answer) return std::nullopt;

    const std::string choice = trim(*answer);
    if(choice == "1") return PlayMode::SHUFFLE;
    if(choice == "2") return PlayMode::LIST;
    if(choice == "3") return PlayMode::SEARCH;
    out_ << "Invalid choice. Please try again.\n";
  }
}

std::optional<SearchRequest> ConsoleMenu::promptSearch(){
  auto term = readLine("Enter Song Name: ");
  if(!term) return std::nullopt;
  auto dir = readLine("Enter the directory to search in (leave blank for current directory): ");
  if(!dir) return std::nullopt;

  SearchRequest req;
  req.term = trim(*term);
  req.directory = trim(*dir);
  return req;
}

std::size_t ConsoleMenu::chooseMatch(const deck_library::Library& matches){
  out_ << "Found the following files:\n";
  for(std::size_t i = 0; i < matches.size(); ++i){
    out_ << (i + 1) << ": " << matches[i] << "\n";
  }
  auto answer = readLine("Enter the number of the file you want to play: ");
  if(!answer) throw mpvdeck::InvalidSelection("Invalid selection. Exiting.");
  return deck_session::parseSelection(*answer, matches.size());
}

void ConsoleMenu::showPlaying(const std::string& path){
  out_ << "Playing: " << path << "\n" << std::flush;
}

void ConsoleMenu::showError(const std::string& message){
  out_ << message << "\n" << std::flush;
}

} // namespace deck_ui

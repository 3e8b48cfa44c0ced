#include "mpvdeck/control/PlayerConsole.hpp"
#include "mpvdeck/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <ostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mpvdeck {

namespace {

std::string defaultMusicDir(){
  const char* home = std::getenv("HOME");
  if(!home || !*home) return "Music";
  return (fs::path(home) / "Music").string();
}

std::string defaultBaseDir(){
  std::error_code ec;
  auto cwd = fs::current_path(ec);
  return ec ? std::string(".") : cwd.string();
}

} // namespace

PlayerConsole::PlayerConsole(const rclcpp::NodeOptions& options)
: Node("player_console", options)
{
  session_cfg_.music_dir  = declare_parameter<std::string>("music_dir", defaultMusicDir());
  session_cfg_.base_dir   = declare_parameter<std::string>("base_dir", defaultBaseDir());
  session_cfg_.extensions = declare_parameter<std::vector<std::string>>(
      "extensions", std::vector<std::string>{});
  int max_tracks = declare_parameter<int>("max_tracks", 0);
  int seed       = declare_parameter<int>("seed", 0);
  session_cfg_.max_tracks = max_tracks > 0 ? static_cast<std::size_t>(max_tracks) : 0;
  session_cfg_.seed = seed > 0 ? static_cast<unsigned int>(seed) : 0;

  player_cmd_.program   = declare_parameter<std::string>("player", "mpv");
  player_cmd_.args      = declare_parameter<std::vector<std::string>>(
      "player_args", std::vector<std::string>{});
  player_cmd_.fallbacks = declare_parameter<std::vector<std::string>>(
      "fallback_players", std::vector<std::string>{});
  int poll_ms  = declare_parameter<int>("poll_interval_ms", 100);
  int grace_ms = declare_parameter<int>("term_grace_ms", 1500);
  player_cmd_.poll_interval = std::chrono::milliseconds(std::max(1, poll_ms));
  player_cmd_.term_grace    = std::chrono::milliseconds(std::max(0, grace_ms));

  mode_        = declare_parameter<int>("mode", 0);
  search_term_ = declare_parameter<std::string>("search_term", "");
  search_dir_  = declare_parameter<std::string>("search_dir", "");

  if(player_cmd_.program.empty()){
    throw std::invalid_argument("parameter 'player' must not be empty");
  }

  launcher_ = std::make_unique<deck_audio::ProcessLauncher>(player_cmd_);
  now_playing_pub_ = create_publisher<std_msgs::msg::String>("~/now_playing", 10);

  RCLCPP_INFO(get_logger(), "Player console ready (player=%s, music_dir=%s, base_dir=%s)",
              player_cmd_.program.c_str(), session_cfg_.music_dir.c_str(),
              session_cfg_.base_dir.c_str());
}

void PlayerConsole::setLauncher(std::unique_ptr<deck_audio::PlayerLauncher> launcher){
  if(!launcher) throw std::invalid_argument("launcher must not be null");
  launcher_ = std::move(launcher);
}

void PlayerConsole::publishNowPlaying(const std::string& path){
  std_msgs::msg::String msg;
  msg.data = path;
  now_playing_pub_->publish(msg);
}

int PlayerConsole::run(std::istream& in, std::ostream& out){
  deck_ui::ConsoleMenu menu(in, out);

  std::optional<deck_ui::PlayMode> mode;
  if(mode_ == 0){
    mode = menu.promptMode();
    if(!mode || !rclcpp::ok()) return 0;
  } else if(mode_ >= 1 && mode_ <= 3){
    mode = static_cast<deck_ui::PlayMode>(mode_);
  } else {
    RCLCPP_ERROR(get_logger(), "Invalid mode parameter %d (expected 0..3)", mode_);
    menu.showError("Invalid choice.");
    return 1;
  }

  deck_session::PlaybackSession session(session_cfg_, *launcher_,
                                        []{ return rclcpp::ok(); });
  session.setNowPlaying([this, &menu](const std::string& path){
    menu.showPlaying(path);
    publishNowPlaying(path);
  });

  try {
    return runMode(*mode, session, menu);
  } catch(const PlaybackError& e){
    RCLCPP_ERROR(get_logger(), "%s", e.what());
    menu.showError(e.what());
    return 1;
  }
}

int PlayerConsole::runMode(deck_ui::PlayMode mode, deck_session::PlaybackSession& session,
                           deck_ui::ConsoleMenu& menu){
  using deck_session::SelectionPolicy;

  switch(mode){
    case deck_ui::PlayMode::SHUFFLE: {
      auto r = session.runContinuous(SelectionPolicy::RANDOM);
      RCLCPP_INFO(get_logger(), "Shuffle play finished after %zu tracks", r.tracks_played);
      return 0;
    }
    case deck_ui::PlayMode::LIST: {
      auto r = session.runContinuous(SelectionPolicy::SEQUENTIAL);
      RCLCPP_INFO(get_logger(), "List play finished after %zu tracks", r.tracks_played);
      return 0;
    }
    case deck_ui::PlayMode::SEARCH: {
      deck_ui::SearchRequest req;
      if(!search_term_.empty()){
        req.term = search_term_;
        req.directory = search_dir_;
      } else {
        auto answered = menu.promptSearch();
        if(!answered || !rclcpp::ok()) return 0;
        req = *answered;
      }
      auto r = session.runSearch(req.term, req.directory,
                                 [&menu](const deck_library::Library& matches){
                                   return menu.chooseMatch(matches);
                                 });
      if(r.interrupted || !r.last_status) return 0;
      return *r.last_status >= 0 ? *r.last_status : 1;
    }
  }
  return 1;
}

} // namespace mpvdeck

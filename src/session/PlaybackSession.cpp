#include "mpvdeck/session/PlaybackSession.hpp"
#include "mpvdeck/errors.hpp"

#include <random>
#include <rclcpp/rclcpp.hpp>

namespace deck_session {

namespace {

rclcpp::Logger sessionLogger(){
  return rclcpp::get_logger("PlaybackSession");
}

unsigned int pickSeed(unsigned int configured){
  if(configured != 0) return configured;
  std::random_device rd;
  return rd();
}

} // namespace

PlaybackSession::PlaybackSession(SessionConfig config, deck_audio::PlayerLauncher& launcher,
                                 deck_audio::KeepRunning keep_running)
: config_(std::move(config)),
  launcher_(launcher),
  keep_running_(std::move(keep_running)),
  rng_(pickSeed(config_.seed)) {}

bool PlaybackSession::keepRunning() const {
  return !keep_running_ || keep_running_();
}

deck_library::LibraryQuery PlaybackSession::makeQuery(const std::string& dir, bool recursive,
                                                      const std::string& term) const {
  deck_library::LibraryQuery q;
  q.directory = dir;
  q.recursive = recursive;
  q.filter_term = term;
  q.extensions = config_.extensions;
  return q;
}

std::optional<int> PlaybackSession::play(const std::string& filepath){
  // Only one player at a time: reap anything left over first.
  if(current_){
    current_->terminate();
    current_.reset();
  }

  current_ = launcher_.launch(filepath);
  if(now_playing_) now_playing_(filepath);

  auto status = current_->wait(keep_running_);
  if(!status){
    RCLCPP_INFO(sessionLogger(), "Interrupted, stopping player for %s", filepath.c_str());
    current_->terminate();
  }
  current_.reset();
  return status;
}

SessionResult PlaybackSession::runContinuous(SelectionPolicy policy){
  if(policy == SelectionPolicy::SEARCH_PICK){
    throw mpvdeck::InvalidSelection("Search pick is not a continuous mode.");
  }
  const bool shuffle = policy == SelectionPolicy::RANDOM;
  const auto& dir = shuffle ? config_.music_dir : config_.base_dir;
  auto library = deck_library::enumerate(makeQuery(dir, false, ""));
  return runContinuous(library, policy);
}

SessionResult PlaybackSession::runContinuous(const deck_library::Library& library,
                                             SelectionPolicy policy){
  if(library.empty()) throw mpvdeck::EmptyLibrary("No files to play.");

  RCLCPP_INFO(sessionLogger(), "Continuous %s play over %zu files",
              policyName(policy), library.size());

  SessionResult result;
  SelectionState state;
  while(keepRunning()){
    if(config_.max_tracks > 0 && result.tracks_played >= config_.max_tracks) break;

    auto [path, next] = selectNext(library, policy, state, rng_);
    state = next;

    auto status = play(path);
    ++result.tracks_played;
    if(!status){
      result.interrupted = true;
      return result;
    }
    result.last_status = status;
    if(*status != 0){
      RCLCPP_WARN(sessionLogger(), "Player exited with status %d for %s, continuing",
                  *status, path.c_str());
    }
  }
  result.interrupted = !keepRunning();
  return result;
}

SessionResult PlaybackSession::runSearch(const std::string& term, const std::string& directory,
                                         const Chooser& chooser){
  const std::string root = directory.empty() ? config_.base_dir : directory;
  auto matches = deck_library::enumerate(makeQuery(root, true, term));

  SelectionState state;
  state.picked = chooser(matches);
  auto [path, next] = selectNext(matches, SelectionPolicy::SEARCH_PICK, state, rng_);
  (void)next;

  SessionResult result;
  if(!keepRunning()){
    result.interrupted = true;
    return result;
  }
  auto status = play(path);
  result.tracks_played = 1;
  result.last_status = status;
  result.interrupted = !status.has_value();
  if(status && *status != 0){
    RCLCPP_WARN(sessionLogger(), "Player exited with status %d for %s", *status, path.c_str());
  }
  return result;
}

} // namespace deck_session

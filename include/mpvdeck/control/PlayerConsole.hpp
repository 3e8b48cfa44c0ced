#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/string.hpp>

#include "mpvdeck/audio/PlayerLauncher.hpp"
#include "mpvdeck/audio/ProcessLauncher.hpp"
#include "mpvdeck/session/PlaybackSession.hpp"
#include "mpvdeck/ui/ConsoleMenu.hpp"

namespace mpvdeck {

/**
 * @brief ROS node that runs one interactive playback session.
 *
 * PlayerConsole reads its configuration from node parameters, asks the user
 * for a mode (unless one is preset), runs the matching session and publishes
 * every started file on `~/now_playing`. Interrupts arrive through the ROS
 * signal handling: the session polls rclcpp::ok() while a player runs.
 */
class PlayerConsole : public rclcpp::Node {
public:
  /**
   * @brief Construct the node and declare its parameters.
   * @param options Node options, parameter overrides included.
   */
  explicit PlayerConsole(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

  /**
   * @brief Run one session on the given console streams.
   * @param in User answers.
   * @param out Prompts, listings and error messages.
   * @return Process exit status.
   */
  int run(std::istream& in, std::ostream& out);

  /**
   * @brief Replace the process launcher, e.g. with a test double.
   * @param launcher New launcher, must not be null.
   */
  void setLauncher(std::unique_ptr<deck_audio::PlayerLauncher> launcher);

  const deck_session::SessionConfig& sessionConfig() const { return session_cfg_; }
  const deck_audio::PlayerCommand& playerCommand() const { return player_cmd_; }

private:
  /**
   * @brief Dispatch a selected mode to the session.
   * @return Process exit status.
   */
  int runMode(deck_ui::PlayMode mode, deck_session::PlaybackSession& session,
              deck_ui::ConsoleMenu& menu);

  void publishNowPlaying(const std::string& path);

  deck_session::SessionConfig session_cfg_;
  deck_audio::PlayerCommand player_cmd_;
  int mode_{0};
  std::string search_term_;
  std::string search_dir_;
  std::unique_ptr<deck_audio::PlayerLauncher> launcher_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr now_playing_pub_;
};

} // namespace mpvdeck

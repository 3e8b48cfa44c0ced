#include <exception>
#include <iostream>
#include <rclcpp/rclcpp.hpp>

#include "mpvdeck/control/PlayerConsole.hpp"

// --- main ------------------------------------------------------------------

int main(int argc, char **argv) {
  rclcpp::init(argc, argv);
  int code = 1;
  try {
    auto node = std::make_shared<mpvdeck::PlayerConsole>();
    code = node->run(std::cin, std::cout);
  } catch(const std::exception& e) {
    RCLCPP_FATAL(rclcpp::get_logger("player_console"), "%s", e.what());
    code = 1;
  }
  rclcpp::shutdown();
  return code;
}

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "mpvdeck/audio/PlayerLauncher.hpp"
#include "mpvdeck/errors.hpp"

namespace deck_test {

// Shared record of what the fake launcher did.
struct LaunchLog {
  std::vector<std::string> launched;
  int active{0};
  int max_active{0};
  int overlapping_launches{0};
  int terminated{0};
};

// Handle that "plays" instantly unless the session was cancelled.
class FakeHandle : public deck_audio::PlaybackHandle {
public:
  FakeHandle(LaunchLog& log, int status) : log_(log), status_(status) {
    ++log_.active;
    if(log_.active > log_.max_active) log_.max_active = log_.active;
  }
  ~FakeHandle() override { terminate(); }

  std::optional<int> wait(const deck_audio::KeepRunning& keep_running) override {
    if(done_) return status_;
    if(keep_running && !keep_running()) return std::nullopt;
    finish();
    return status_;
  }

  void terminate() override {
    if(done_) return;
    ++log_.terminated;
    finish();
  }

  bool finished() const override { return done_; }

private:
  void finish(){
    done_ = true;
    --log_.active;
  }

  LaunchLog& log_;
  int status_;
  bool done_{false};
};

class FakeLauncher : public deck_audio::PlayerLauncher {
public:
  std::unique_ptr<deck_audio::PlaybackHandle> launch(const std::string& filepath) override {
    if(fail) throw mpvdeck::PlayerLaunchFailure("cannot execute 'fake': No such file or directory");
    if(log.active != 0) ++log.overlapping_launches;
    log.launched.push_back(filepath);
    if(on_launch) on_launch(log.launched.size());
    return std::make_unique<FakeHandle>(log, status_for ? status_for(filepath) : 0);
  }

  LaunchLog log;
  bool fail{false};
  std::function<int(const std::string&)> status_for;
  std::function<void(std::size_t)> on_launch;
};

// Scratch directory removed on destruction.
class TempDir {
public:
  TempDir(){
    static int counter = 0;
    path_ = std::filesystem::temp_directory_path() /
            ("mpvdeck_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir(){
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string touch(const std::string& relative) const {
    auto p = path_ / relative;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p) << "x";
    return p.string();
  }

  std::string mkdir(const std::string& relative) const {
    auto p = path_ / relative;
    std::filesystem::create_directories(p);
    return p.string();
  }

  std::string str() const { return path_.string(); }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace deck_test

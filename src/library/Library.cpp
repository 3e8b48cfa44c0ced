#include "mpvdeck/library/Library.hpp"
#include "mpvdeck/errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <rclcpp/rclcpp.hpp>

namespace fs = std::filesystem;

namespace deck_library {

namespace {

bool hasAllowedExtension(const fs::path& p, const std::vector<std::string>& exts){
  if(exts.empty()) return true;
  std::string ext = toLower(p.extension().string());
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool nameMatches(const fs::path& p, const std::string& lowered_term){
  if(lowered_term.empty()) return true;
  return toLower(p.filename().string()).find(lowered_term) != std::string::npos;
}

std::vector<std::string> normalizeExtensions(const std::vector<std::string>& exts){
  std::vector<std::string> out;
  out.reserve(exts.size());
  for(const auto& e : exts){
    if(e.empty()) continue;
    std::string n = toLower(e);
    if(n.front() != '.') n.insert(n.begin(), '.');
    out.push_back(n);
  }
  return out;
}

} // namespace

std::string toLower(std::string s){
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return std::tolower(c); });
  return s;
}

Library enumerate(const LibraryQuery& query){
  static auto logger = rclcpp::get_logger("Library");

  fs::path root(query.directory.empty() ? "." : query.directory);
  std::error_code ec;
  if(!fs::is_directory(root, ec)){
    throw mpvdeck::EmptyLibrary("Not a directory: '" + root.string() + "'");
  }

  const auto exts = normalizeExtensions(query.extensions);
  const auto term = toLower(query.filter_term);
  Library lib;

  if(query.recursive){
    const auto opts = fs::directory_options::skip_permission_denied;
    for(fs::recursive_directory_iterator it(root, opts, ec), end; it != end; it.increment(ec)){
      if(ec) break;
      const auto& p = it->path();
      if(!fs::is_regular_file(p, ec)) continue;
      if(!nameMatches(p, term) || !hasAllowedExtension(p, exts)) continue;
      lib.push_back(p.string());
    }
  } else {
    for(fs::directory_iterator it(root, ec), end; it != end; it.increment(ec)){
      if(ec) break;
      const auto& p = it->path();
      const std::string name = p.filename().string();
      if(name.empty() || name.front() == '.') continue;
      if(!fs::is_regular_file(p, ec)) continue;
      if(!nameMatches(p, term) || !hasAllowedExtension(p, exts)) continue;
      lib.push_back(p.string());
    }
  }
  if(ec){
    RCLCPP_WARN(logger, "Listing of %s stopped early: %s",
                root.string().c_str(), ec.message().c_str());
  }

  if(lib.empty()){
    if(term.empty()){
      throw mpvdeck::EmptyLibrary("No files found in '" + root.string() + "'.");
    }
    throw mpvdeck::EmptyLibrary("No files found matching '" + query.filter_term +
                                "' in '" + root.string() + "'.");
  }

  std::sort(lib.begin(), lib.end());
  RCLCPP_INFO(logger, "Indexed %zu files in %s", lib.size(), root.string().c_str());
  return lib;
}

Library enumerate(const std::string& directory, bool recursive,
                  const std::string& filter_term){
  LibraryQuery q;
  q.directory = directory;
  q.recursive = recursive;
  q.filter_term = filter_term;
  return enumerate(q);
}

Library filterByName(const Library& library, const std::string& term){
  const auto lowered = toLower(term);
  Library out;
  for(const auto& entry : library){
    if(nameMatches(fs::path(entry), lowered)) out.push_back(entry);
  }
  return out;
}

} // namespace deck_library

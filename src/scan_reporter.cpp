/**
 * @file scan_reporter.cpp
 * @brief Media file discovery implementation
 */

#include "crf_target/scan_reporter.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"

namespace crf_target {

namespace fs = std::filesystem;

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

/// Canonical path, or the absolute path when it cannot be resolved
std::string real_path(const fs::path &p) {
  std::error_code ec;
  fs::path canonical = fs::canonical(p, ec);
  if (!ec)
    return canonical.string();
  fs::path abs = fs::absolute(p, ec);
  return ec ? p.string() : abs.lexically_normal().string();
}

} // anonymous namespace

ScanCursor::ScanCursor(std::string root_path, ScanProgress &scan_progress,
                       std::vector<std::string> exts)
    : root(std::move(root_path)), progress(scan_progress),
      extensions(std::move(exts)) {
  for (auto &e : extensions)
    e = lowercase(e);
}

bool ScanCursor::matches(const fs::path &path) const {
  std::string ext = path.extension().string();
  if (ext.size() < 2)
    return false;
  ext = lowercase(ext.substr(1));
  return std::find(extensions.begin(), extensions.end(), ext) !=
         extensions.end();
}

void ScanCursor::enter(const fs::path &dir) {
  if (!visited_dirs.insert(real_path(dir)).second) {
    LOG_DEBUG("scan: {} already visited", dir.string());
    return;
  }

  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied,
                            ec);
  if (ec) {
    LOG_WARN("Cannot read directory {}: {}", dir.string(), ec.message());
    return;
  }
  stack.push_back(std::move(it));
}

bool ScanCursor::first_visit(const fs::path &file) {
  return visited_files.insert(real_path(file)).second;
}

Status ScanCursor::restart() {
  started = true;
  root_is_file = false;
  stack.clear();
  visited_dirs.clear();
  visited_files.clear();
  progress.reset();

  std::error_code ec;
  fs::file_status st = fs::status(root, ec);
  if (ec || !fs::exists(st)) {
    root_status = Status(ErrorCode::NotFound,
                         fmt::format("{} does not exist", root));
    return root_status;
  }

  root_status = Status::ok();
  if (fs::is_directory(st)) {
    enter(root);
  } else {
    root_is_file = true;
  }
  return root_status;
}

bool ScanCursor::next(std::string &path) {
  if (!started)
    restart();

  if (root_is_file) {
    root_is_file = false;
    if (matches(root) && first_visit(root)) {
      progress.increment();
      path = root;
      return true;
    }
    return false;
  }

  while (!stack.empty()) {
    fs::directory_iterator &it = stack.back();
    if (it == fs::directory_iterator()) {
      stack.pop_back();
      continue;
    }

    fs::directory_entry entry = *it;
    std::error_code ec;
    it.increment(ec);
    if (ec) {
      LOG_WARN("Directory iteration stopped early: {}", ec.message());
      stack.pop_back();
    }

    /// status() follows symlinks; a dangling link reports not_found
    fs::file_status st = entry.status(ec);
    if (ec)
      continue;

    if (fs::is_directory(st)) {
      enter(entry.path());
      continue;
    }
    if (!fs::is_regular_file(st) || !matches(entry.path()))
      continue;
    if (!first_visit(entry.path()))
      continue;

    progress.increment();
    path = entry.path().string();
    return true;
  }
  return false;
}

Status scan_all(const std::string &root, ScanProgress &progress,
                std::vector<std::string> &files) {
  files.clear();
  ScanCursor cursor(root, progress);
  Status st = cursor.restart();
  if (!st.is_ok())
    return st;

  std::string path;
  while (cursor.next(path))
    files.push_back(path);
  return Status::ok();
}

} // namespace crf_target

/**
 * @file scan_reporter.hpp
 * @brief Lazy, restartable discovery of media files under a folder
 *
 * @details ScanCursor walks a directory tree with an explicit stack of
 *          directory iterators and yields one media file per next() call:
 *
 *          - only files with a recognized media extension are yielded
 *            (case-insensitive)
 *
 *          - symlinked directories are followed, but every real directory
 *            and every real file is visited at most once, so cyclic links
 *            neither hang nor double-count
 *
 *          - each yielded file increments the shared ScanProgress counter
 */

#ifndef CRF_TARGET_SCAN_REPORTER_HPP
#define CRF_TARGET_SCAN_REPORTER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @class ScanProgress
 * @brief Number of media files discovered by the current scan.
 * @note Reset at scan start, monotonically increasing during a scan.
 */
class ScanProgress {
  std::atomic<uint64_t> count{0};

public:
  void reset() { count.store(0); }
  void increment() { count.fetch_add(1); }
  uint64_t total() const { return count.load(); }
};

/**
 * @class ScanCursor
 * @brief Lazy iteration over the media files below a root path.
 */
class ScanCursor {
public:
  ScanCursor(std::string root, ScanProgress &progress,
             std::vector<std::string> extensions = media_extensions());

  /**
   * @brief Advance to the next media file.
   * @param path Output: path of the file (under root, links not resolved)
   * @return false once the tree is exhausted
   */
  bool next(std::string &path);

  /**
   * @brief Start over from the root and reset the counter.
   * @return Ok, or NotFound when root does not exist
   */
  Status restart();

  /// Error from the last restart (Ok if the root was readable)
  const Status &status() const { return root_status; }

  /// True if path has one of the recognized extensions
  bool matches(const std::filesystem::path &path) const;

private:
  std::string root;
  ScanProgress &progress;
  std::vector<std::string> extensions;

  bool started = false;
  bool root_is_file = false;
  Status root_status;
  std::vector<std::filesystem::directory_iterator> stack;
  std::unordered_set<std::string> visited_dirs;
  std::unordered_set<std::string> visited_files;

  /// Push dir if its real path has not been visited
  void enter(const std::filesystem::path &dir);

  /// Record a file's real path; false if already seen
  bool first_visit(const std::filesystem::path &file);
};

/**
 * @brief Convenience: collect every media file below root.
 * @return Ok or the cursor's root error
 */
Status scan_all(const std::string &root, ScanProgress &progress,
                std::vector<std::string> &files);

} // namespace crf_target

#endif // CRF_TARGET_SCAN_REPORTER_HPP

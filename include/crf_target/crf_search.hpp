/**
 * @file crf_search.hpp
 * @brief Quality-targeted binary search over the encoder quality parameter
 *
 * @details Finds the largest quality parameter (cheapest output) whose
 *          pooled score still meets the target.
 *
 * @attention ALGORITHM:
 *
 * - Search the closed interval [min_bound, max_bound], lower = min,
 *   upper = max
 *
 * - candidate = (lower + upper + 1) / 2 so the interval always shrinks
 *
 * - score >= target - tolerance: candidate is acceptable, lower = candidate
 *
 * - score < target - tolerance: candidate too aggressive,
 *   upper = candidate - 1
 *
 * - Stops when lower == upper or the iteration budget is spent. If nothing
 *   passed and min_bound was never measured, min_bound is measured once.
 *
 * - If no candidate met the target the result is min_bound with
 *   TargetUnreachable, which callers record as a warning.
 *
 * @note Score is treated as monotone in the parameter. Near the target,
 *       measurement noise can make it non-monotone; the search then keeps
 *       the first boundary crossing it finds.
 */

#ifndef CRF_TARGET_CRF_SEARCH_HPP
#define CRF_TARGET_CRF_SEARCH_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "encode_runner.hpp"
#include "quality_prober.hpp"
#include "status.hpp"
#include "stream_copier.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @struct SearchState
 * @brief Live state of one search; lower <= candidate <= upper.
 */
struct SearchState {
  int lower = 0;
  int upper = 0;
  int candidate = 0;
  double last_score = 0.0;
  int iterations = 0;
  double tolerance = 0.0;
};

/**
 * @struct SearchRequest
 * @brief Input and bounds for one search.
 */
struct SearchRequest {
  std::string input_path;
  double start = 0.0;    //< Window start (chunk searches)
  double end = 0.0;      //< Window end; <= start means whole input
  double duration = 0.0; //< Length of what is searched, for sampling

  Encoder encoder = Encoder::Libx265;
  std::string preset;
  std::string extra_params;
  std::string pix_fmt;

  double target = 97.0;
  int min_bound = 0;
  int max_bound = 28;
  int max_iterations = 8;
  double tolerance = 0.0;

  PoolMethod pool = PoolMethod::Mean;
  int threads = 1;
  int subsample = 1;

  /// Search on a sample when duration exceeds sample_threshold
  bool allow_sampling = false;
  double sample_threshold = 600.0;
  double sample_every = 180.0;
  double sample_duration = 20.0;

  std::string work_dir;    //< Directory for sample and candidate files
  std::string file_prefix; //< Unique per task and chunk
  std::string log_prefix;  //< "[Task x]" or "[Task x][Chunk n]"
};

/**
 * @struct SearchResult
 * @brief Outcome of a search.
 */
struct SearchResult {
  int quality = 0;          //< Chosen parameter
  double score = 0.0;       //< Score measured at quality (0 if never measured)
  int iterations = 0;       //< Encode+measure cycles spent
  bool target_met = false;
  bool used_sample = false;
  std::vector<std::pair<int, double>> history; //< (candidate, score)
};

/**
 * @struct SearchCallbacks
 * @brief Optional observers for a running search.
 */
struct SearchCallbacks {
  std::function<void(const SearchState &)> on_iteration;
  EncodeProgressCallback on_encode;
};

/**
 * @class CrfSearchEngine
 * @brief Drives encode+measure cycles until the search converges.
 */
class CrfSearchEngine {
  EncodeRunner &encoder;
  QualityProber &prober;
  StreamCopier &copier;

public:
  CrfSearchEngine(EncodeRunner &enc, QualityProber &prob, StreamCopier &copy);

  /**
   * @brief Run the search.
   *
   * @param result Filled on Ok and on TargetUnreachable
   * @return Ok, TargetUnreachable (result.quality = min_bound),
   *         InvalidArgument, EncodeFailed, MeasurementFailed, Cancelled or
   *         the copier's error when the sample cannot be built
   *
   * @note Every sample and candidate file is deleted before returning, on
   *       all paths.
   */
  Status search(const SearchRequest &request, const CancelTokenPtr &token,
                SearchResult &result,
                const SearchCallbacks &callbacks = SearchCallbacks());

  /// Validate bounds, target and measurement settings
  static Status validate(const SearchRequest &request);

private:
  Status evaluate(const SearchRequest &request, const std::string &source,
                  double start, double end, int quality,
                  const CancelTokenPtr &token,
                  const SearchCallbacks &callbacks, double &score);
};

} // namespace crf_target

#endif // CRF_TARGET_CRF_SEARCH_HPP

/**
 * @file crf_search.cpp
 * @brief CRF binary search implementation
 */

#include "crf_target/crf_search.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"

namespace crf_target {

CrfSearchEngine::CrfSearchEngine(EncodeRunner &enc, QualityProber &prob,
                                 StreamCopier &copy)
    : encoder(enc), prober(prob), copier(copy) {}

Status CrfSearchEngine::validate(const SearchRequest &request) {
  if (request.input_path.empty())
    return Status(ErrorCode::InvalidArgument, "search needs an input");
  if (request.min_bound < 0 || request.min_bound > request.max_bound) {
    return Status(ErrorCode::InvalidArgument,
                  fmt::format("invalid bounds [{}, {}]", request.min_bound,
                              request.max_bound));
  }
  if (!(request.target > 0.0 && request.target <= 100.0)) {
    return Status(ErrorCode::InvalidArgument,
                  fmt::format("target {} outside (0, 100]", request.target));
  }
  if (request.max_iterations < 1)
    return Status(ErrorCode::InvalidArgument, "iteration budget must be >= 1");
  if (request.threads < 1 || request.subsample < 1)
    return Status(ErrorCode::InvalidArgument,
                  "threads and subsample must be >= 1");
  return Status::ok();
}

Status CrfSearchEngine::evaluate(const SearchRequest &request,
                                 const std::string &source, double start,
                                 double end, int quality,
                                 const CancelTokenPtr &token,
                                 const SearchCallbacks &callbacks,
                                 double &score) {
  ScopedTempFiles temps;
  std::string candidate = temps.add(
      (std::filesystem::path(request.work_dir) /
       fmt::format("{}.crf{}.mkv", request.file_prefix, quality))
          .string());

  EncodeRequest enc;
  enc.input_path = source;
  enc.output_path = candidate;
  enc.encoder = request.encoder;
  enc.quality = quality;
  enc.preset = request.preset;
  enc.extra_params = request.extra_params;
  enc.pix_fmt = request.pix_fmt;
  enc.start = start;
  enc.end = end;

  TIMER_START(candidate);
  Status st = encoder.encode(enc, callbacks.on_encode, token);
  if (!st.is_ok())
    return st;

  MeasureRequest measure;
  measure.reference_path = source;
  measure.candidate_path = candidate;
  measure.reference_start = start;
  measure.reference_end = end;
  measure.pool = request.pool;
  measure.threads = request.threads;
  measure.subsample = request.subsample;

  st = prober.measure(measure, token, score);
  TIMER_END(candidate,
            fmt::format("{} crf {} encode+measure", request.log_prefix, quality));
  return st;
}

Status CrfSearchEngine::search(const SearchRequest &request,
                               const CancelTokenPtr &token,
                               SearchResult &result,
                               const SearchCallbacks &callbacks) {
  result = SearchResult();

  Status st = validate(request);
  if (!st.is_ok())
    return st;

  ScopedTempFiles temps;
  TIMER_START(search);

  // **---- SAMPLE SELECTION ----**

  /// Long inputs are searched on evenly spaced windows copied into one file
  std::string source = request.input_path;
  double start = request.start;
  double end = request.end;

  if (request.allow_sampling && request.duration > request.sample_threshold) {
    auto segments = plan_sample_segments(
        request.duration, request.sample_every, request.sample_duration);
    std::string sample = temps.add(
        (std::filesystem::path(request.work_dir) /
         fmt::format("{}.sample.mkv", request.file_prefix))
            .string());

    LOG_INFO("{} Building {} sample windows of {:.0f}s", request.log_prefix,
             segments.size(), request.sample_duration);
    st = copier.extract_segments(request.input_path, segments, sample, token);
    if (!st.is_ok())
      return st;

    source = sample;
    start = 0.0;
    end = 0.0;
    result.used_sample = true;
  }

  // **---- BINARY SEARCH ----**

  SearchState state;
  state.lower = request.min_bound;
  state.upper = request.max_bound;
  state.candidate = request.min_bound;
  state.tolerance = request.tolerance;

  const double threshold = request.target - request.tolerance;
  int best = -1;
  double best_score = 0.0;
  bool min_measured = false;
  double min_score = 0.0;

  auto run_candidate = [&](int quality, double &score) -> Status {
    state.candidate = quality;
    Status s = evaluate(request, source, start, end, quality, token,
                        callbacks, score);
    if (!s.is_ok())
      return s;

    state.iterations++;
    state.last_score = score;
    result.history.emplace_back(quality, score);
    if (quality == request.min_bound) {
      min_measured = true;
      min_score = score;
    }

    bool met = score >= threshold;
    LOG_INFO("{} crf {:>2} -> vmaf {:.2f} {} (target {:.2f}, range [{}, {}])",
             request.log_prefix, quality, score, met ? ">=" : "<",
             request.target, state.lower, state.upper);
    if (met) {
      best = quality;
      best_score = score;
    }
    return Status::ok();
  };

  while (state.lower < state.upper &&
         state.iterations < request.max_iterations) {
    /// Upper midpoint: lower = candidate must still make progress
    int candidate = state.lower + (state.upper - state.lower + 1) / 2;

    double score = 0.0;
    st = run_candidate(candidate, score);
    if (!st.is_ok())
      return st;

    if (score >= threshold) {
      state.lower = candidate;
    } else {
      state.upper = candidate - 1;
    }
    state.candidate = std::min(std::max(state.candidate, state.lower),
                               state.upper);
    if (callbacks.on_iteration)
      callbacks.on_iteration(state);
  }

  /// lower only moves on success, so an unproven lower is min_bound
  if (best < 0 && !min_measured &&
      state.iterations < request.max_iterations) {
    double score = 0.0;
    st = run_candidate(request.min_bound, score);
    if (!st.is_ok())
      return st;
    if (callbacks.on_iteration)
      callbacks.on_iteration(state);
  }

  result.iterations = state.iterations;
  TIMER_END(search, fmt::format("{} search", request.log_prefix));

  if (best < 0) {
    result.quality = request.min_bound;
    result.score = min_score;
    result.target_met = false;
    return Status(ErrorCode::TargetUnreachable,
                  fmt::format("no quality in [{}, {}] reached {:.2f}; using {}",
                              request.min_bound, request.max_bound,
                              request.target, request.min_bound));
  }

  result.quality = best;
  result.score = best_score;
  result.target_met = true;
  LOG_SUCCESS("{} Selected crf {} (vmaf {:.2f}) after {} iterations",
              request.log_prefix, best, best_score, state.iterations);
  return Status::ok();
}

} // namespace crf_target

/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/crf_target.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef CRF_TARGET_CONFIG_HPP
#define CRF_TARGET_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace crf_target {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  double parsed = std::strtod(val, &end);
  return (end && *end == '\0') ? parsed : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Value or default (an empty variable counts as set)
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

// **---- QUALITY TARGET ----**

/// Target pooled VMAF score (0-100]
inline double vmaf_target() {
  static double val = get_env_double("VMAF_TARGET", 97.0);
  return val;
}

/// Upper bound of the quality parameter search (lower bound is always 0)
inline int max_crf() {
  static int val = get_env_int("MAX_CRF", 28);
  return val;
}

/// Pool method name: min, harmonic_mean or mean
inline std::string vmaf_pool() {
  static std::string val = get_env_string("VMAF_POOL", "mean");
  return val;
}

/// Threads given to each measurement run
inline int vmaf_threads() {
  static int val = get_env_int("VMAF_THREADS", 2);
  return val;
}

/// Measure every Nth frame (1 = every frame)
inline int vmaf_subsample() {
  static int val = get_env_int("VMAF_SUBSAMPLE", 1);
  return val;
}

// **---- ENCODING ----**

/// Encoder name (see Encoder enum)
inline std::string encoder() {
  static std::string val = get_env_string("ENCODER", "libx265");
  return val;
}

/// Execution mode: default or chunked
inline std::string mode() {
  static std::string val = get_env_string("MODE", "default");
  return val;
}

/// Output pixel format
inline std::string pix_fmt() {
  static std::string val = get_env_string("PIX_FMT", "yuv420p10le");
  return val;
}

/**
 * @brief Per-encoder preset and extra parameter strings.
 * @note Passed through to the encoder untouched.
 */
inline std::string preset_x265() {
  static std::string val = get_env_string("PRESET_X265", "slow");
  return val;
}
inline std::string params_x265() {
  static std::string val = get_env_string(
      "PARAMS_X265", "-x265-params limit-sao:bframes=8:psy-rd=1:aq-mode=3");
  return val;
}
inline std::string preset_hevc_nvenc() {
  static std::string val = get_env_string("PRESET_HEVC_NVENC", "p7");
  return val;
}
inline std::string params_hevc_nvenc() {
  static std::string val = get_env_string(
      "PARAMS_HEVC_NVENC", "-rc-lookahead 100 -b_ref_mode each -tune hq");
  return val;
}
inline std::string preset_hevc_qsv() {
  static std::string val = get_env_string("PRESET_HEVC_QSV", "veryslow");
  return val;
}
inline std::string params_hevc_qsv() {
  static std::string val = get_env_string(
      "PARAMS_HEVC_QSV", "-init_hw_device qsv=intel,child_device=0 "
                         "-b_strategy 1 -look_ahead 1 -async_depth 100");
  return val;
}
inline std::string preset_av1_qsv() {
  static std::string val = get_env_string("PRESET_AV1_QSV", "1");
  return val;
}
inline std::string params_av1_qsv() {
  static std::string val = get_env_string(
      "PARAMS_AV1_QSV", "-init_hw_device qsv=intel,child_device=0 "
                        "-b_strategy 1 -look_ahead 1 -async_depth 100");
  return val;
}
inline std::string preset_libsvtav1() {
  static std::string val = get_env_string("PRESET_LIBSVTAV1", "5");
  return val;
}
inline std::string params_libsvtav1() {
  static std::string val = get_env_string("PARAMS_LIBSVTAV1", "");
  return val;
}
inline std::string preset_libaom_av1() {
  static std::string val = get_env_string("PRESET_LIBAOM_AV1", "4");
  return val;
}
inline std::string params_libaom_av1() {
  static std::string val = get_env_string("PARAMS_LIBAOM_AV1", "");
  return val;
}

// **---- SAMPLING & CHUNKING ----**

/// Take one sample window every N seconds
inline double sample_every_sec() {
  static double val = get_env_double("SAMPLE_EVERY_SEC", 180.0);
  return val;
}

/// Length of each sample window
inline double sample_duration_sec() {
  static double val = get_env_double("SAMPLE_DURATION_SEC", 20.0);
  return val;
}

/**
 * @brief Inputs longer than this are searched on a sample.
 * @note Shorter inputs (and every chunk) are searched in full.
 */
inline double sample_threshold_sec() {
  static double val = get_env_double("SAMPLE_THRESHOLD_SEC", 600.0);
  return val;
}

/// Minimum chunk duration for scene splitting
inline double scene_split_min_sec() {
  static double val = get_env_double("SCENE_SPLIT_MIN_SEC", 2.0);
  return val;
}

/// Scene change score threshold for the select filter
inline double scene_threshold() {
  static double val = get_env_double("SCENE_THRESHOLD", 0.4);
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Maximum number of tasks running at once
 * @note Additional started tasks stay queued until a slot frees.
 */
inline int max_concurrent_tasks() {
  static int val = get_env_int("MAX_CONCURRENT_TASKS", 1);
  return val;
}

/**
 * @brief Concurrent chunk jobs per chunked task
 * @note 0 = auto-calculate as (available_cpus / VMAF_THREADS)
 */
inline int chunk_workers() {
  static int val = get_env_int("CHUNK_WORKERS", 0);
  return val;
}

// **---- SEARCH ----**

/// Hard cap on encode+measure cycles per search
inline int search_max_iterations() {
  static int val = get_env_int("SEARCH_MAX_ITERATIONS", 8);
  return val;
}

/**
 * @brief Skip the search and encode at this value
 * @note -1 = search. Applies to whole inputs and to every chunk.
 */
inline int fixed_crf() {
  static int val = get_env_int("FIXED_CRF", -1);
  return val;
}

/// A candidate meets the target if score >= target - tolerance
inline double search_tolerance() {
  static double val = get_env_double("SEARCH_TOLERANCE", 0.0);
  return val;
}

// **---- TOOLS & PATHS ----**

/// FFmpeg binary used for encoding, measurement and stream copy
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Directory for samples, candidates and chunk files (empty = system temp)
inline std::string temp_dir() {
  static std::string val = get_env_string("TEMP_DIR", "");
  return val;
}

/// Enable LOG_DEBUG output
inline bool verbose() {
  static bool val = (get_env_int("VERBOSE", 0) != 0);
  return val;
}

} // namespace Config
} // namespace crf_target

#endif // CRF_TARGET_CONFIG_HPP

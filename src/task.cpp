/**
 * @file task.cpp
 * @brief Task configuration helpers
 */

#include "crf_target/task.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "crf_target/config.hpp"
#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"

namespace crf_target {

std::string default_preset(Encoder encoder) {
  switch (encoder) {
  case Encoder::HevcNvenc:
    return Config::preset_hevc_nvenc();
  case Encoder::HevcQsv:
    return Config::preset_hevc_qsv();
  case Encoder::Av1Qsv:
    return Config::preset_av1_qsv();
  case Encoder::LibSvtAv1:
    return Config::preset_libsvtav1();
  case Encoder::LibAomAv1:
    return Config::preset_libaom_av1();
  case Encoder::Libx265:
  default:
    return Config::preset_x265();
  }
}

std::string default_params(Encoder encoder) {
  switch (encoder) {
  case Encoder::HevcNvenc:
    return Config::params_hevc_nvenc();
  case Encoder::HevcQsv:
    return Config::params_hevc_qsv();
  case Encoder::Av1Qsv:
    return Config::params_av1_qsv();
  case Encoder::LibSvtAv1:
    return Config::params_libsvtav1();
  case Encoder::LibAomAv1:
    return Config::params_libaom_av1();
  case Encoder::Libx265:
  default:
    return Config::params_x265();
  }
}

TaskConfig make_task_config(const std::string &input_path,
                            const std::string &output_path) {
  TaskConfig c;
  c.input_path = input_path;
  c.output_path = output_path;

  if (!parse_encoder(Config::encoder(), c.encoder))
    LOG_WARN("Unknown ENCODER '{}', using libx265", Config::encoder());
  if (!parse_mode(Config::mode(), c.mode))
    LOG_WARN("Unknown MODE '{}', using default", Config::mode());
  if (!parse_pool_method(Config::vmaf_pool(), c.pool))
    LOG_WARN("Unknown VMAF_POOL '{}', using mean", Config::vmaf_pool());

  c.target = Config::vmaf_target();
  c.min_crf = 0;
  c.max_crf = Config::max_crf();
  c.fixed_crf = Config::fixed_crf();
  c.vmaf_threads = effective_vmaf_threads(Config::vmaf_threads());
  c.vmaf_subsample = Config::vmaf_subsample();
  c.pix_fmt = Config::pix_fmt();
  c.preset = default_preset(c.encoder);
  c.extra_params = default_params(c.encoder);
  c.scene_split_min = Config::scene_split_min_sec();
  c.scene_threshold = Config::scene_threshold();
  c.sample_every = Config::sample_every_sec();
  c.sample_duration = Config::sample_duration_sec();
  c.sample_threshold = Config::sample_threshold_sec();
  c.max_iterations = Config::search_max_iterations();
  c.tolerance = Config::search_tolerance();
  c.chunk_workers =
      calculate_chunk_workers(Config::chunk_workers(), c.vmaf_threads);
  c.work_dir = temp_root();
  return c;
}

Status validate(const TaskConfig &config) {
  auto invalid = [](const std::string &msg) {
    return Status(ErrorCode::InvalidArgument, msg);
  };

  if (config.input_path.empty())
    return invalid("input path is empty");
  if (config.output_path.empty())
    return invalid("output path is empty");
  if (config.input_path == config.output_path)
    return invalid("output would overwrite the input");
  if (!(config.target > 0.0 && config.target <= 100.0))
    return invalid(fmt::format("target {} outside (0, 100]", config.target));
  if (config.min_crf < 0 || config.min_crf > config.max_crf)
    return invalid(fmt::format("quality bounds [{}, {}] are invalid",
                               config.min_crf, config.max_crf));
  if (config.vmaf_threads < 1)
    return invalid("measurement threads must be >= 1");
  if (config.vmaf_subsample < 1)
    return invalid("measurement subsample must be >= 1");
  if (config.max_iterations < 1)
    return invalid("search iteration budget must be >= 1");
  if (config.tolerance < 0.0)
    return invalid("search tolerance must be >= 0");
  if (config.scene_split_min <= 0.0)
    return invalid("scene split minimum must be > 0");
  if (config.sample_every <= 0.0 || config.sample_duration <= 0.0)
    return invalid("sample interval and duration must be > 0");
  if (config.chunk_workers < 1)
    return invalid("chunk workers must be >= 1");
  return Status::ok();
}

std::string output_file_name(const std::string &input_path,
                             const TaskConfig &config) {
  std::filesystem::path in(input_path);
  std::string ext = in.extension().string();
  if (!ext.empty() && ext[0] == '.')
    ext.erase(0, 1);
  if (ext.empty())
    ext = "mkv";

  return fmt::format("{}.{}.vmaf{}.{}.subsample{}.{}", in.stem().string(),
                     to_string(config.encoder), config.target,
                     to_string(config.pool), config.vmaf_subsample, ext);
}

} // namespace crf_target

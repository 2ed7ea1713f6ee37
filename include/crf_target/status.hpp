/**
 * @file status.hpp
 * @brief Error codes and the Status return type
 *
 * @details Every fallible operation returns a Status instead of throwing.
 *          Standard library exceptions are caught at module edges and turned
 *          into a Status with a human-readable message.
 */

#ifndef CRF_TARGET_STATUS_HPP
#define CRF_TARGET_STATUS_HPP

#include <string>
#include <utility>

namespace crf_target {

/**
 * @brief Error taxonomy.
 * @note TargetUnreachable and SceneDetectionUnavailable are recoverable and
 *       are recorded as task warnings rather than failures.
 */
enum class ErrorCode {
  Ok,
  InvalidArgument,
  DuplicateTask,
  NotFound,
  InvalidState,
  ProcessFailed,
  MeasurementFailed,
  EncodeFailed,
  TargetUnreachable,
  SceneDetectionUnavailable,
  PartialChunkFailure,
  ProbeFailed,
  IoError,
  Cancelled
};

const char *to_string(ErrorCode code);

/**
 * @struct Status
 * @brief Result of a fallible operation.
 */
struct Status {
  ErrorCode code = ErrorCode::Ok;
  std::string message;

  Status() = default;
  Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  static Status ok() { return Status(); }

  bool is_ok() const { return code == ErrorCode::Ok; }
  bool is_cancelled() const { return code == ErrorCode::Cancelled; }

  /// "<CODE>: <message>" for logs and task records
  std::string describe() const;
};

} // namespace crf_target

#endif // CRF_TARGET_STATUS_HPP

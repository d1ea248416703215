#include "pipeline-options.h"

#include <stdexcept>

#include "string-utils.h"

void parse_pipeline_options(const PipelineOptionList &in_options,
                            PipelineOptions &out_options) {
  for (const auto &in_option : in_options) {
    const std::string option_name = to_lowercase(trim(in_option.first));
    const char *value = in_option.second.c_str();
    if (option_name == "min_buffer_duration") {
      out_options.min_buffer_duration = double_from_string(value);
    } else if (option_name == "max_buffer_duration") {
      out_options.max_buffer_duration = double_from_string(value);
    } else if (option_name == "vad_threshold_db") {
      out_options.vad_threshold_db =
          static_cast<float>(double_from_string(value));
    } else if (option_name == "vad_hold_open_window") {
      out_options.vad_hold_open_window = double_from_string(value);
    } else if (option_name == "drain_poll_interval") {
      out_options.drain_poll_interval = double_from_string(value);
    } else if (option_name == "stop_drain_timeout") {
      out_options.stop_drain_timeout = double_from_string(value);
    } else if (option_name == "language_hint") {
      out_options.language_hint = trim(in_option.second);
    } else if (option_name == "log_chunk_activity") {
      out_options.log_chunk_activity = bool_from_string(value);
    } else {
      throw std::runtime_error("Unknown pipeline option: '" + in_option.first +
                               "'");
    }
  }
}

std::pair<std::string, std::string> parse_option_assignment(
    const std::string &assignment) {
  const size_t equals_index = assignment.find('=');
  if (equals_index == std::string::npos || equals_index == 0) {
    throw std::runtime_error("Expected name=value, got '" + assignment + "'");
  }
  return {trim(assignment.substr(0, equals_index)),
          trim(assignment.substr(equals_index + 1))};
}

void validate_pipeline_options(const PipelineOptions &options) {
  if (options.min_buffer_duration <= 0.0) {
    throw std::invalid_argument("min_buffer_duration must be positive, got " +
                                std::to_string(options.min_buffer_duration));
  }
  if (options.max_buffer_duration < options.min_buffer_duration) {
    throw std::invalid_argument(
        "max_buffer_duration (" + std::to_string(options.max_buffer_duration) +
        ") must not be less than min_buffer_duration (" +
        std::to_string(options.min_buffer_duration) + ")");
  }
  if (options.vad_hold_open_window < 0.0) {
    throw std::invalid_argument("vad_hold_open_window must not be negative");
  }
  if (options.drain_poll_interval <= 0.0) {
    throw std::invalid_argument("drain_poll_interval must be positive");
  }
  if (options.stop_drain_timeout < 0.0) {
    throw std::invalid_argument("stop_drain_timeout must not be negative");
  }
}

std::string pipeline_options_to_string(const PipelineOptions &options) {
  std::string result = "PipelineOptions(min_buffer_duration=" +
                       std::to_string(options.min_buffer_duration);
  result += ", max_buffer_duration=" +
            std::to_string(options.max_buffer_duration);
  result += ", vad_threshold_db=" + std::to_string(options.vad_threshold_db);
  result += ", vad_hold_open_window=" +
            std::to_string(options.vad_hold_open_window);
  result += ", drain_poll_interval=" +
            std::to_string(options.drain_poll_interval);
  result += ", stop_drain_timeout=" +
            std::to_string(options.stop_drain_timeout);
  result += ", language_hint='" + options.language_hint + "'";
  result += ", log_chunk_activity=" +
            std::string(options.log_chunk_activity ? "true" : "false") + ")";
  return result;
}

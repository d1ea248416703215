#ifndef PIPELINE_OPTIONS_H
#define PIPELINE_OPTIONS_H

#include <string>
#include <utility>
#include <vector>

struct PipelineOptions {
  // A speaker's window is dispatched once it holds this much audio.
  double min_buffer_duration = 2.0;
  // While a speaker's call is in flight its buffer is trimmed back to
  // min_buffer_duration once it reaches this length.
  double max_buffer_duration = 5.0;
  float vad_threshold_db = -50.0f;
  double vad_hold_open_window = 0.8;
  // How often waiting loops re-check their state, in seconds.
  double drain_poll_interval = 0.05;
  // Upper bound on how long stop() waits for calls already in flight.
  double stop_drain_timeout = 10.0;
  // Passed to local backends, empty for none.
  std::string language_hint = "";
  bool log_chunk_activity = false;
};

typedef std::vector<std::pair<std::string, std::string>> PipelineOptionList;

// Applies name/value pairs on top of out_options. Names are case-insensitive.
// Throws std::runtime_error for unknown names or malformed values.
void parse_pipeline_options(const PipelineOptionList &in_options,
                            PipelineOptions &out_options);

// Parses a single "name=value" string, as given on the command line.
std::pair<std::string, std::string> parse_option_assignment(
    const std::string &assignment);

// Throws std::invalid_argument if the values cannot work together.
void validate_pipeline_options(const PipelineOptions &options);

std::string pipeline_options_to_string(const PipelineOptions &options);

#endif

#include "pipeline-options.h"

#include <stdexcept>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("pipeline-options") {
  SUBCASE("defaults") {
    PipelineOptions options;
    CHECK(options.min_buffer_duration == 2.0);
    CHECK(options.max_buffer_duration == 5.0);
    CHECK(options.vad_threshold_db == -50.0f);
    CHECK(options.vad_hold_open_window == 0.8);
    CHECK(options.language_hint.empty());
    CHECK_FALSE(options.log_chunk_activity);
    CHECK_NOTHROW(validate_pipeline_options(options));
  }

  SUBCASE("parse-by-name") {
    PipelineOptions options;
    parse_pipeline_options({{"min_buffer_duration", "1.5"},
                            {"MAX_BUFFER_DURATION", "4"},
                            {" vad_threshold_db ", "-40"},
                            {"vad_hold_open_window", "0.5"},
                            {"drain_poll_interval", "0.01"},
                            {"stop_drain_timeout", "2"},
                            {"language_hint", " es "},
                            {"log_chunk_activity", "true"}},
                           options);
    CHECK(options.min_buffer_duration == 1.5);
    CHECK(options.max_buffer_duration == 4.0);
    CHECK(options.vad_threshold_db == -40.0f);
    CHECK(options.vad_hold_open_window == 0.5);
    CHECK(options.drain_poll_interval == 0.01);
    CHECK(options.stop_drain_timeout == 2.0);
    CHECK(options.language_hint == "es");
    CHECK(options.log_chunk_activity);
    CHECK(pipeline_options_to_string(options).find("language_hint='es'") !=
          std::string::npos);
  }

  SUBCASE("parse-errors") {
    PipelineOptions options;
    CHECK_THROWS_AS(parse_pipeline_options({{"sample_rate", "8000"}}, options),
                    std::runtime_error);
    CHECK_THROWS_AS(
        parse_pipeline_options({{"min_buffer_duration", "two"}}, options),
        std::runtime_error);
    CHECK(options.min_buffer_duration == 2.0);
  }

  SUBCASE("option-assignment") {
    CHECK(parse_option_assignment("min_buffer_duration=3") ==
          std::pair<std::string, std::string>("min_buffer_duration", "3"));
    CHECK(parse_option_assignment("language_hint = ru") ==
          std::pair<std::string, std::string>("language_hint", "ru"));
    CHECK(parse_option_assignment("language_hint=") ==
          std::pair<std::string, std::string>("language_hint", ""));
    CHECK_THROWS_AS(parse_option_assignment("no_value"), std::runtime_error);
    CHECK_THROWS_AS(parse_option_assignment("=3"), std::runtime_error);
  }

  SUBCASE("validation") {
    PipelineOptions options;
    options.max_buffer_duration = 1.0f;
    CHECK_THROWS_AS(validate_pipeline_options(options), std::invalid_argument);
    options = PipelineOptions();
    options.min_buffer_duration = 0.0f;
    CHECK_THROWS_AS(validate_pipeline_options(options), std::invalid_argument);
    options = PipelineOptions();
    options.vad_hold_open_window = -0.1f;
    CHECK_THROWS_AS(validate_pipeline_options(options), std::invalid_argument);
    options = PipelineOptions();
    options.drain_poll_interval = 0.0f;
    CHECK_THROWS_AS(validate_pipeline_options(options), std::invalid_argument);
    options = PipelineOptions();
    options.max_buffer_duration = options.min_buffer_duration;
    CHECK_NOTHROW(validate_pipeline_options(options));
  }
}

#include "ort-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest.h>

TEST_CASE("ort-utils") {
  SUBCASE("ort_session_from_path-null-api") {
    REQUIRE(ort_session_from_path(nullptr, nullptr, nullptr, "model.ort",
                                  nullptr, nullptr, nullptr) < 0);
  }
  SUBCASE("ort_session_from_path-missing-file") {
    const OrtApi *ort_api = OrtGetApiBase()->GetApi(ORT_API_VERSION);
    REQUIRE(ort_api != nullptr);
    OrtSession *session = nullptr;
    const char *mmapped_data = nullptr;
    size_t mmapped_data_size = 0;
    REQUIRE(ort_session_from_path(ort_api, nullptr, nullptr,
                                  "no-such-speaker-model.ort", &session,
                                  &mmapped_data, &mmapped_data_size) < 0);
    CHECK(session == nullptr);
    CHECK(mmapped_data == nullptr);
    CHECK(mmapped_data_size == 0);
  }
  SUBCASE("ort_session_from_memory") {
    REQUIRE(ort_session_from_memory(nullptr, nullptr, nullptr, nullptr, 0,
                                    nullptr) < 0);
  }
}

#ifndef MEETSCRIBE_DEBUG_UTILS_H
#define MEETSCRIBE_DEBUG_UTILS_H

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

static inline const char *_meetscribe_filename_without_path(const char *path) {
  const char *filename = strrchr(path, '/');
  if (filename == NULL) {
    filename = strrchr(path, '\\');
  }
  return (filename == NULL) ? path : filename + 1;
}

#define FILENAME_ONLY (_meetscribe_filename_without_path(__FILE__))

#define LOGF(format, ...)                                                     \
  do {                                                                        \
    fprintf(stderr, "%s:%d:%s(): " format, FILENAME_ONLY, __LINE__, __func__, \
            __VA_ARGS__);                                                     \
    fprintf(stderr, "\n");                                                    \
  } while (0)
#define LOG(x) LOGF("%s", (x))

#define RETURN_ON_ERROR(error)  \
  do {                          \
    if (error != 0) {           \
      LOGF("Error: %d", error); \
      return -1;                \
    }                           \
  } while (0)

#define RETURN_ON_FALSE(expr)           \
  do {                                  \
    if (!(expr)) {                      \
      LOG("Error: " #expr " is false"); \
      return -1;                        \
    }                                   \
  } while (0)

#define RETURN_ON_NULL(ptr)              \
  do {                                   \
    if (ptr == nullptr) {                \
      LOG("Error: " #ptr " is nullptr"); \
      return -1;                         \
    }                                    \
  } while (0)

#define ENABLE_TIMER 1

#ifdef ENABLE_TIMER
#include <chrono>
#define TIMER_START(x) \
  auto x##_timer_start = std::chrono::steady_clock::now();

#define TIMER_END(x)                                                          \
  auto x##_timer_end = std::chrono::steady_clock::now();                      \
  auto x##_timer_duration =                                                   \
      std::chrono::duration_cast<std::chrono::milliseconds>(x##_timer_end -   \
                                                            x##_timer_start); \
  LOGF(#x " took %lld milliseconds", (long long)x##_timer_duration.count());
#else
#define TIMER_START(x)
#define TIMER_END(x)
#endif

#define THROW_WITH_LOG(message)                                             \
  do {                                                                      \
    LOG(message);                                                           \
    throw std::runtime_error(                                               \
        std::string(FILENAME_ONLY) + ":" + std::to_string(__LINE__) + ":" + \
        std::string(__func__) + " - " + std::string(message));              \
  } while (0)

#define LOG_INT(x) LOGF(#x " = %d", (x));
#define LOG_UINT64(x) LOGF(#x " = %" PRIu64, (x));
#define LOG_SIZET(x) LOGF(#x " = %zu", (x));
#define LOG_FLOAT(x) LOGF(#x " = %f", (x));
#define LOG_STRING(x) LOGF(#x " = %s", (x).c_str());
#define LOG_BOOL(x) LOGF(#x " = %s", (x) ? "true" : "false");

// Chatty per-chunk counters only log the first few events and then every
// tenth one.
inline bool should_log_count(uint64_t count) {
  return count <= 5 || count % 10 == 0;
}

// Reads a 16-bit PCM WAV file, mixing down to mono. Returns false and logs on
// failure.
bool load_wav_data(const std::string &path, std::vector<float> *out_samples,
                   int32_t *out_sample_rate = nullptr);

bool save_wav_data(const std::string &path, const std::vector<float> &samples,
                   int32_t sample_rate = 16000);

std::vector<uint8_t> load_file_into_memory(const std::string &path);
void save_memory_to_file(const std::string &path,
                         const std::vector<uint8_t> &data);

template <typename T>
T gate(T value, T min, T max) {
  return std::max<T>(min, std::min<T>(value, max));
}

#endif  // MEETSCRIBE_DEBUG_UTILS_H

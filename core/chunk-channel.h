#ifndef CHUNK_CHANNEL_H
#define CHUNK_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include "audio-chunk.h"

enum class ChannelPopResult {
  ITEM,
  TIMEOUT,
  CLOSED,
};

// Thread-safe FIFO connecting a producer and a consumer running on different
// threads. Producers never block. Once closed, pushes are rejected and
// consumers drain whatever is left before seeing CLOSED.
template <typename T>
class ChunkChannel {
 public:
  ChunkChannel() = default;
  ChunkChannel(const ChunkChannel &) = delete;
  ChunkChannel &operator=(const ChunkChannel &) = delete;

  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(this->mutex);
      if (this->closed) {
        return false;
      }
      this->items.push_back(std::move(item));
    }
    this->item_available.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns false once the channel is
  // closed and empty.
  bool pop(T *out_item) {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->item_available.wait(
        lock, [this] { return !this->items.empty() || this->closed; });
    return take_front(out_item);
  }

  template <typename Rep, typename Period>
  ChannelPopResult pop_for(T *out_item,
                           const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(this->mutex);
    const bool ready = this->item_available.wait_for(
        lock, timeout,
        [this] { return !this->items.empty() || this->closed; });
    if (!ready) {
      return ChannelPopResult::TIMEOUT;
    }
    return take_front(out_item) ? ChannelPopResult::ITEM
                                : ChannelPopResult::CLOSED;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(this->mutex);
      this->closed = true;
    }
    this->item_available.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->closed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->items.size();
  }

 private:
  bool take_front(T *out_item) {
    if (this->items.empty()) {
      return false;
    }
    *out_item = std::move(this->items.front());
    this->items.pop_front();
    return true;
  }

  mutable std::mutex mutex;
  std::condition_variable item_available;
  std::deque<T> items;
  bool closed = false;
};

typedef ChunkChannel<AudioChunk> AudioChunkChannel;
typedef ChunkChannel<LabeledAudioChunk> LabeledChunkChannel;
typedef ChunkChannel<TranscriptSegment> TranscriptChannel;

typedef std::shared_ptr<AudioChunkChannel> AudioChunkChannelPtr;
typedef std::shared_ptr<LabeledChunkChannel> LabeledChunkChannelPtr;
typedef std::shared_ptr<TranscriptChannel> TranscriptChannelPtr;

#endif

// src/audio/event_queue.hpp
// Hand-off of packed MIDI messages from the control thread to the audio
// callback, on a moodycamel::ReaderWriterQueue.
//
// One producer (push/reset), one consumer (drain). The queue is allocated
// once at its fixed capacity and push() never grows it: a full queue rejects
// the message. reset() bumps a generation counter that every queued message
// carries, so the consumer drops whatever was pushed before the reset and
// runs its reset handler exactly once before the first message after it:
//
//   queue.drain([&] { kill_voices(); },
//               [&](std::uint32_t raw) { apply(raw); });

#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#include <readerwriterqueue.h>

namespace audio {

class EventQueue {
public:
  explicit EventQueue(std::size_t capacity)
      : queue_(capacity), capacity_(capacity) {}

  EventQueue(const EventQueue &) = delete;
  EventQueue &operator=(const EventQueue &) = delete;

  // Producer side. False when the queue is full.
  bool push(std::uint32_t raw) {
    if (queue_.size_approx() >= capacity_)
      return false;
    return queue_.try_enqueue(
        Item{raw, generation_.load(std::memory_order_relaxed)});
  }

  // Producer side. Everything pushed so far is dropped unplayed.
  void reset() { generation_.fetch_add(1, std::memory_order_release); }

  // Consumer side. onReset() runs once per batch of resets not yet seen,
  // before the messages pushed after them.
  template <typename OnReset, typename OnEvent>
  void drain(OnReset &&onReset, OnEvent &&onEvent) {
    const std::uint32_t current = generation_.load(std::memory_order_acquire);
    if (current != seen_) {
      seen_ = current;
      onReset();
    }

    Item item;
    while (queue_.try_dequeue(item)) {
      const auto age = static_cast<std::int32_t>(item.generation - seen_);
      if (age < 0)
        continue; // pushed before a reset already handled
      if (age > 0) {
        seen_ = item.generation;
        onReset();
      }
      onEvent(item.raw);
    }
  }

  std::size_t capacity() const { return capacity_; }
  std::size_t size_approx() const { return queue_.size_approx(); }

private:
  struct Item {
    std::uint32_t raw = 0;
    std::uint32_t generation = 0;
  };

  moodycamel::ReaderWriterQueue<Item> queue_;
  std::size_t capacity_;
  std::atomic<std::uint32_t> generation_{0};
  std::uint32_t seen_ = 0; // consumer only
};

} // namespace audio

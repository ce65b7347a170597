// src/common/reader.hpp
// Tiny safe cursors for big-endian reads + MIDI VLQ.
//  - Bytes: owns a small buffer (header, chunk headers).
//  - SourceReader: walks a window of an io::ByteSource through a fixed-size
//    refill buffer, so a track can be decoded in place without loading it.
// Both throw EndOfData when a read would run past the end.
#pragma once
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/io.hpp"

struct EndOfData : std::runtime_error {
  explicit EndOfData(const std::string &what) : std::runtime_error(what) {}
};

struct Bytes {
  std::vector<std::uint8_t> data;
  std::size_t off = 0; // current read position

  explicit Bytes(const std::vector<std::uint8_t> &src) : data(src), off(0) {}
  Bytes(const std::uint8_t *first, std::size_t n) : data(first, first + n) {}

  [[nodiscard]] std::uint8_t u8() {
    if (off + 1 > data.size())
      throw EndOfData("EOF while reading u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    if (off + 2 > data.size())
      throw EndOfData("EOF while reading be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be32() {
    if (off + 4 > data.size())
      throw EndOfData("EOF while reading be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  void skip(std::size_t n) {
    if (off + n > data.size())
      throw EndOfData("EOF while skipping bytes");
    off += n;
  }
};

// Cursor over [begin, limit) of a ByteSource. `off` is an absolute offset
// into the source, so it can be stored in a checkpoint and restored later.
class SourceReader {
public:
  static constexpr std::size_t kWindow = 4096;

  SourceReader(io::ByteSource &src, std::uint64_t begin, std::uint64_t limit)
      : src_(&src), limit_(limit), off_(begin) {}

  std::uint64_t off() const { return off_; }
  std::uint64_t limit() const { return limit_; }
  bool at_end() const { return off_ >= limit_; }

  // Jump to an absolute offset; drops the buffered window.
  void seek(std::uint64_t off) {
    off_ = off;
    bufBegin_ = 0;
    bufLen_ = 0;
  }

  [[nodiscard]] std::uint8_t u8() {
    if (off_ >= limit_)
      throw EndOfData("EOF while reading u8");
    if (off_ < bufBegin_ || off_ >= bufBegin_ + bufLen_)
      refill();
    return buf_[static_cast<std::size_t>(off_++ - bufBegin_)];
  }

  void skip(std::uint64_t n) {
    if (n > limit_ - off_)
      throw EndOfData("EOF while skipping bytes");
    off_ += n;
  }

private:
  void refill() {
    const std::uint64_t want = std::min<std::uint64_t>(kWindow, limit_ - off_);
    buf_.resize(kWindow);
    bufBegin_ = off_;
    bufLen_ = src_->read_at(off_, buf_.data(), static_cast<std::size_t>(want));
    if (bufLen_ == 0)
      throw EndOfData("EOF while reading source at offset " +
                      std::to_string(off_));
  }

  io::ByteSource *src_;
  std::uint64_t limit_;
  std::uint64_t off_;
  std::vector<std::uint8_t> buf_;
  std::uint64_t bufBegin_ = 0;
  std::size_t bufLen_ = 0;
};

// Read a MIDI VLQ (Variable Length Quantity).
template <typename Reader> inline std::uint32_t read_vlq(Reader &r) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      break; // high bit 0 => last byte
  }
  return v;
}

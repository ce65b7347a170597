// src/io/io.hpp
// Thin I/O façade for the MIDI loaders.
//  - read_all: whole file into memory (buffered timeline).
//  - ByteSource: random-access reads, so the streamed timeline can decode
//    tracks in place and jump back to a recorded byte offset.
//
// Throws std::runtime_error on errors.

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace io {

std::vector<std::uint8_t> read_all(const std::filesystem::path &p);

class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::uint64_t size() const = 0;

  // Copy up to n bytes starting at offset into dst. Returns the number of
  // bytes copied (0 at or past the end).
  virtual std::size_t read_at(std::uint64_t offset, std::uint8_t *dst,
                              std::size_t n) = 0;
};

class MemorySource final : public ByteSource {
public:
  explicit MemorySource(std::vector<std::uint8_t> bytes)
      : bytes_(std::move(bytes)) {}

  std::uint64_t size() const override { return bytes_.size(); }
  std::size_t read_at(std::uint64_t offset, std::uint8_t *dst,
                      std::size_t n) override;

private:
  std::vector<std::uint8_t> bytes_;
};

// Keeps the file open for the lifetime of the source.
class FileSource final : public ByteSource {
public:
  explicit FileSource(const std::filesystem::path &p);

  std::uint64_t size() const override { return size_; }
  std::size_t read_at(std::uint64_t offset, std::uint8_t *dst,
                      std::size_t n) override;

private:
  std::ifstream f_;
  std::uint64_t size_ = 0;
  std::filesystem::path path_;
};

} // namespace io

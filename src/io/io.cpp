// src/io/io.cpp

#include "io/io.hpp"

#include <algorithm>
#include <cstring>
#include <ios>
#include <stdexcept>
#include <string>

namespace io {

std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  std::ifstream f(p, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + p.string());
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + p.string());
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw std::runtime_error("Could not read file: " + p.string());
  }
  return buf;
}

std::size_t MemorySource::read_at(std::uint64_t offset, std::uint8_t *dst,
                                  std::size_t n) {
  if (offset >= bytes_.size())
    return 0;
  const std::size_t count = static_cast<std::size_t>(
      std::min<std::uint64_t>(n, bytes_.size() - offset));
  std::memcpy(dst, bytes_.data() + offset, count);
  return count;
}

FileSource::FileSource(const std::filesystem::path &p)
    : f_(p, std::ios::binary), path_(p) {
  if (!f_) {
    throw std::runtime_error("Could not open file: " + p.string());
  }
  f_.seekg(0, std::ios::end);
  const std::streamsize sz = f_.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + p.string());
  }
  size_ = static_cast<std::uint64_t>(sz);
}

std::size_t FileSource::read_at(std::uint64_t offset, std::uint8_t *dst,
                                std::size_t n) {
  if (offset >= size_)
    return 0;
  const std::size_t count =
      static_cast<std::size_t>(std::min<std::uint64_t>(n, size_ - offset));
  f_.clear(); // a previous short read leaves eofbit set
  f_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!f_.read(reinterpret_cast<char *>(dst),
               static_cast<std::streamsize>(count))) {
    throw std::runtime_error("Could not read file: " + path_.string());
  }
  return count;
}

} // namespace io

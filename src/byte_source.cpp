#include "byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

FileByteSource::FileByteSource(const std::filesystem::path& path)
  : path_(path), in_(path, std::ios::binary) {
  if(!in_) {
    throw std::system_error(errno ? errno : EIO, std::generic_category(),
                            "unable to open " + path_.string());
  }
}

std::size_t FileByteSource::read(char* buffer, std::size_t length) {
  if(length == 0 || in_.eof()) return 0;
  in_.read(buffer, static_cast<std::streamsize>(length));
  if(in_.bad()) {
    throw std::system_error(errno ? errno : EIO, std::generic_category(),
                            "read failed on " + path_.string());
  }
  return static_cast<std::size_t>(in_.gcount());
}

std::size_t MemoryByteSource::read(char* buffer, std::size_t length) {
  std::size_t count = std::min(length, data_.size() - offset_);
  if(count == 0) return 0;
  std::memcpy(buffer, data_.data() + offset_, count);
  offset_ += count;
  return count;
}

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

// A sequential stream of bytes. read() fills up to `length` bytes and returns
// how many it wrote; 0 means the stream is exhausted. Failures throw.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::size_t read(char* buffer, std::size_t length) = 0;
};

class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(const std::filesystem::path& path);

  std::size_t read(char* buffer, std::size_t length) override;

private:
  std::filesystem::path path_;
  std::ifstream in_;
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string_view data) : data_(data) {}

  std::size_t read(char* buffer, std::size_t length) override;

private:
  std::string_view data_;
  std::size_t offset_ = 0;
};

#include "content_hasher.hpp"

#include <openssl/sha.h>

#include <stdexcept>
#include <vector>

ContentHasher::ContentHasher(std::size_t chunk_size,
                             ProgressState* progress,
                             const CancelToken* cancel)
  : chunk_size_(chunk_size), progress_(progress), cancel_(cancel) {
  if(chunk_size_ == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
}

HashResult ContentHasher::hash(ByteSource& source) const {
  SHA256_CTX ctx;
  if(SHA256_Init(&ctx) != 1) {
    throw std::runtime_error("SHA256_Init failed");
  }

  HashResult result;
  std::vector<char> buffer(chunk_size_);
  for(;;) {
    if(cancel_) cancel_->throw_if_cancelled();
    std::size_t read = source.read(buffer.data(), buffer.size());
    if(read == 0) break;
    if(SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(buffer.data()), read) != 1) {
      throw std::runtime_error("SHA256_Update failed");
    }
    result.bytes += read;
    if(progress_) progress_->add_bytes(read);
  }

  if(SHA256_Final(result.digest.data(), &ctx) != 1) {
    throw std::runtime_error("SHA256_Final failed");
  }
  return result;
}

HashResult ContentHasher::hash_file(const std::filesystem::path& path) const {
  FileByteSource source(path);
  return hash(source);
}

HashResult ContentHasher::hash_bytes(std::string_view data) const {
  MemoryByteSource source(data);
  return hash(source);
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include "core/config.hpp"

namespace humanfmt {

// Called after each chunk is digested with the chunk's size in bytes.
using ChunkCallback = std::function<void(uint64_t)>;

// Hex digest of an in-memory buffer.
// algorithm is any digest name OpenSSL knows ("md5", "sha1", "sha256", ...).
// Throws InvalidArgument for an unknown algorithm.
std::string hash_string(const std::string& data,
                        const std::string& algorithm = "sha1");

// Digest a stream chunk by chunk (OpenSSL EVP), never holding more than
// chunk_size bytes in memory. Returns false and sets error_msg on a read or
// digest failure. Throws InvalidArgument for an unknown algorithm or a zero
// chunk size.
bool hash_stream(std::istream& in, std::string& hexdigest, std::string& error_msg,
                 const std::string& algorithm = "sha1",
                 size_t chunk_size = DEFAULT_CHUNK_SIZE,
                 const ChunkCallback& on_chunk = {});

// Same for a file on disk.
bool hash_file(const std::string& path, std::string& hexdigest, std::string& error_msg,
               const std::string& algorithm = "sha1",
               size_t chunk_size = DEFAULT_CHUNK_SIZE,
               const ChunkCallback& on_chunk = {});

} // namespace humanfmt

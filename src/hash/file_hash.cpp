#include "hash/file_hash.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

#include "core/errors.hpp"

namespace humanfmt {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

const EVP_MD* lookup_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) throw InvalidArgument("unrecognized hash algorithm '" + algorithm + "'");
    return md;
}

std::string bytes_to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; i++)
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    return oss.str();
}

} // namespace

std::string hash_string(const std::string& data, const std::string& algorithm) {
    const EVP_MD* md = lookup_digest(algorithm);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, md, nullptr) != 1) {
        throw InvalidArgument("digest '" + algorithm + "' failed");
    }
    return bytes_to_hex(digest, digest_len);
}

bool hash_stream(std::istream& in, std::string& hexdigest, std::string& error_msg,
                 const std::string& algorithm, size_t chunk_size,
                 const ChunkCallback& on_chunk) {
    const EVP_MD* md = lookup_digest(algorithm);
    if (chunk_size == 0) throw InvalidArgument("chunk size must be positive");

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        error_msg = "cannot initialize " + algorithm + " digest";
        return false;
    }

    std::vector<char> buf(chunk_size);
    while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) || in.gcount() > 0) {
        auto got = static_cast<size_t>(in.gcount());
        if (EVP_DigestUpdate(ctx.get(), buf.data(), got) != 1) {
            error_msg = algorithm + " digest update failed";
            return false;
        }
        if (on_chunk) on_chunk(got);
    }
    if (in.bad()) {
        error_msg = "read error";
        return false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        error_msg = algorithm + " digest finalization failed";
        return false;
    }
    hexdigest = bytes_to_hex(digest, digest_len);
    return true;
}

bool hash_file(const std::string& path, std::string& hexdigest, std::string& error_msg,
               const std::string& algorithm, size_t chunk_size,
               const ChunkCallback& on_chunk) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error_msg = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    if (!hash_stream(in, hexdigest, error_msg, algorithm, chunk_size, on_chunk)) {
        error_msg = path + ": " + error_msg;
        return false;
    }
    return true;
}

} // namespace humanfmt

#include "test_util.hpp"
#include "core/errors.hpp"
#include "hash/file_hash.hpp"
#include "progress/progress_bar.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <vector>

using namespace humanfmt;
namespace fs = std::filesystem;

static const char* kHello = "hello, world!\n";

static std::string test_dir;

static void test_hash_string() {
    CHECK_STR_EQ(hash_string(kHello, "md5"), "910c8bc73110b0cd1bc5d2bcae782511");
    CHECK_STR_EQ(hash_string(kHello), "e91ba0972b9055187fa2efa8b5c156f487a8293a");
    CHECK_STR_EQ(hash_string(kHello, "sha256"),
                 "4dca0fd5f424a31b03ab807cbae77eb32bf2d089eed1cee154b3afed458de0dc");
    CHECK_STR_EQ(hash_string(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    CHECK_THROWS(hash_string(kHello, "nosuchdigest"), InvalidArgument);
}

static void test_hash_stream_chunks() {
    std::istringstream in(kHello);
    std::string digest, err;
    std::vector<uint64_t> chunks;
    CHECK(hash_stream(in, digest, err, "sha1", 4,
                      [&chunks](uint64_t n) { chunks.push_back(n); }));
    CHECK_STR_EQ(digest, "e91ba0972b9055187fa2efa8b5c156f487a8293a");
    CHECK_EQ(chunks.size(), 4u);
    if (chunks.size() == 4) {
        CHECK_EQ(chunks[0], 4u);
        CHECK_EQ(chunks[1], 4u);
        CHECK_EQ(chunks[2], 4u);
        CHECK_EQ(chunks[3], 2u);
    }

    // exact multiple of the chunk size: no empty trailing chunk
    std::istringstream even("abcdefgh");
    chunks.clear();
    CHECK(hash_stream(even, digest, err, "md5", 4,
                      [&chunks](uint64_t n) { chunks.push_back(n); }));
    CHECK_EQ(chunks.size(), 2u);
}

static void test_hash_stream_invalid() {
    std::istringstream in(kHello);
    std::string digest, err;
    CHECK_THROWS(hash_stream(in, digest, err, "sha1", 0), InvalidArgument);
    CHECK_THROWS(hash_stream(in, digest, err, "bogus"), InvalidArgument);
}

static void test_hash_file() {
    std::string path = test_dir + "/hello.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << kHello;
    }
    std::string digest, err;
    CHECK(hash_file(path, digest, err, "sha256"));
    CHECK_STR_EQ(digest, "4dca0fd5f424a31b03ab807cbae77eb32bf2d089eed1cee154b3afed458de0dc");

    digest.clear();
    CHECK(!hash_file(test_dir + "/missing.txt", digest, err));
    CHECK(err.find("missing.txt") != std::string::npos);
    CHECK(digest.empty());
}

static void test_progress_integration() {
    std::string path = test_dir + "/data.bin";
    const size_t size = 10000;
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
    }

    std::FILE* sink_file = std::tmpfile();
    double now = 0.0;
    ProgressSink sink;
    sink.out = sink_file;
    sink.clock = [&now] { return now; };

    ProgressBar bar(size, 0, 0.0, SpeedMode::kCumulative, sink, 80);
    std::string digest, err;
    CHECK(hash_file(path, digest, err, "sha1", 1024,
                    [&](uint64_t n) { now += 0.5; bar.update(n); }));
    CHECK_EQ(bar.processed_size(), size);
    bar.finish();
    CHECK(bar.finished());
    CHECK_STR_EQ(digest, hash_string(std::string(size, 'x')));
    CHECK_NEAR(bar.elapsed(), 5.0, 1e-9);

    std::fseek(sink_file, 0, SEEK_END);
    CHECK(std::ftell(sink_file) > 0);
    std::fclose(sink_file);
}

int main() {
    char tmpl[] = "/tmp/humanfmt_hash_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (!dir) {
        std::fprintf(stderr, "mkdtemp failed\n");
        return 1;
    }
    test_dir = dir;

    test_hash_string();
    test_hash_stream_chunks();
    test_hash_stream_invalid();
    test_hash_file();
    test_progress_integration();
    fs::remove_all(test_dir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

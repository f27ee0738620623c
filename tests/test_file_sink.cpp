#include <doctest/doctest.h>
#include <chrono>
#include <fstream>
#include <iterator>
#include "creditrx/file_sink.hpp"

namespace fs = std::filesystem;
using namespace creditrx;

namespace {

// Fresh scratch directory, removed on scope exit.
struct ScratchDir {
    fs::path path;
    ScratchDir() {
        const auto tag = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("creditrx-test-" + std::to_string(tag));
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::vector<uint8_t> read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Names are reduced to their last component") {
    CHECK(file_sink::sanitize_name("rec.bin") == "rec.bin");
    CHECK(file_sink::sanitize_name("../../etc/passwd") == "passwd");
    CHECK(file_sink::sanitize_name("C:\\logs\\day1.csv") == "day1.csv");
    CHECK(file_sink::sanitize_name("") == "download.bin");
    CHECK(file_sink::sanitize_name("..") == "download.bin");
    CHECK(file_sink::sanitize_name("dir/") == "download.bin");
}

TEST_CASE("save writes the bytes and never overwrites") {
    ScratchDir dir;
    const std::vector<uint8_t> a = {1, 2, 3};
    const std::vector<uint8_t> b = {4, 5};
    const std::vector<uint8_t> c = {6};
    fs::path p1, p2, p3;
    std::string err;

    REQUIRE(file_sink::save(dir.path, "rec.bin", a, p1, err));
    REQUIRE(file_sink::save(dir.path, "rec.bin", b, p2, err));
    REQUIRE(file_sink::save(dir.path, "rec.bin", c, p3, err));

    CHECK(p1.filename() == "rec.bin");
    CHECK(p2.filename() == "rec_1.bin");
    CHECK(p3.filename() == "rec_2.bin");
    CHECK(read_all(p1) == a);
    CHECK(read_all(p2) == b);
    CHECK(read_all(p3) == c);
}

TEST_CASE("save creates the output directory and handles names without extension") {
    ScratchDir dir;
    const fs::path nested = dir.path / "a" / "b";
    fs::path p;
    std::string err;
    REQUIRE(file_sink::save(nested, "dump", {}, p, err));
    REQUIRE(file_sink::save(nested, "dump", {9}, p, err));
    CHECK(p.filename() == "dump_1");
    CHECK(fs::exists(nested / "dump"));
}

TEST_CASE("save reports an unusable directory") {
    ScratchDir dir;
    const fs::path blocker = dir.path / "file";
    { std::ofstream(blocker) << "x"; }
    fs::path p;
    std::string err;
    CHECK_FALSE(file_sink::save(blocker / "sub", "x.bin", {1}, p, err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("save refuses a name whose existence cannot be checked") {
    ScratchDir dir;
    const fs::path loop = dir.path / "loop.bin";
    fs::create_symlink("loop.bin", loop);    // resolves to itself: stat fails with ELOOP

    std::error_code ec;
    CHECK(file_sink::unique_path(dir.path, "loop.bin", ec).empty());
    CHECK(ec);

    fs::path p;
    std::string err;
    CHECK_FALSE(file_sink::save(dir.path, "loop.bin", {1, 2}, p, err));
    CHECK(err.find("cannot check") != std::string::npos);
    CHECK(p.empty());
    CHECK(fs::is_symlink(fs::symlink_status(loop)));
}

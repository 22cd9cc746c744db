#include "test_check.hpp"

#include "vidstore/errors.hpp"
#include "vidstore/fileio.hpp"
#include "vidstore/process.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using vidstore::process::PipeMode;
using vidstore::process::Subprocess;

namespace {

void TestRunCapture() {
    VIDSTORE_CHECK(vidstore::process::RunCapture({"sh", "-c", "printf hello"}) == "hello");
    VIDSTORE_CHECK(vidstore::process::RunCapture({"true"}).empty());
}

void TestLargeRead() {
    const std::string out = vidstore::process::RunCapture({"sh", "-c", "head -c 200000 /dev/zero"});
    VIDSTORE_CHECK(out.size() == 200000);
    VIDSTORE_CHECK(out.find_first_not_of('\0') == std::string::npos);
}

void TestStdinPipe() {
    const fs::path dir = fs::temp_directory_path() / ("vidstore_process_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    const fs::path target = dir / "sink.bin";

    std::vector<std::uint8_t> data(150000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7);
    }
    Subprocess proc({"sh", "-c", "cat > \"$0\"", target.string()}, PipeMode::Stdin);
    proc.Write(data.data(), data.size());
    proc.CloseInput();
    proc.Finish();
    VIDSTORE_CHECK(vidstore::fileio::ReadFileBytes(target) == data);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void TestNonZeroExit() {
    bool thrown = false;
    try {
        vidstore::process::RunCapture({"sh", "-c", "echo boom >&2; exit 3"});
    } catch (const vidstore::ExternalProcessError& ex) {
        thrown = true;
        VIDSTORE_CHECK(ex.exit_status() == 3);
        VIDSTORE_CHECK(ex.diagnostic().find("boom") != std::string::npos);
    }
    VIDSTORE_CHECK(thrown);

    Subprocess proc({"sh", "-c", "exit 5"}, PipeMode::Stdout);
    std::uint8_t buffer[16];
    VIDSTORE_CHECK(proc.Read(buffer, sizeof(buffer)) == 0);
    VIDSTORE_CHECK(proc.Wait() == 5);
}

void TestMissingBinary() {
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ExternalProcessError>(
        [] { vidstore::process::RunCapture({"vidstore-no-such-binary-here"}); }));
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>([] { vidstore::process::RunCapture({}); }));
}

void TestTimeout() {
    const auto start = std::chrono::steady_clock::now();
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ExternalProcessError>(
        [] { vidstore::process::RunCapture({"sleep", "5"}, std::chrono::milliseconds(300)); }));
    VIDSTORE_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));
}

void TestReaderExitsEarly() {
    std::vector<std::uint8_t> data(1 << 20, 0x5A);
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ExternalProcessError>([&] {
        Subprocess proc({"sh", "-c", "exit 0"}, PipeMode::Stdin);
        proc.Write(data.data(), data.size());
        proc.CloseInput();
        proc.Finish();
    }));
}

void TestJoinArgs() {
    VIDSTORE_CHECK(vidstore::process::JoinArgs({"ffmpeg", "-i", "in.mp4"}) == "ffmpeg -i in.mp4");
    VIDSTORE_CHECK(vidstore::process::JoinArgs({"ffmpeg", "-i", "my video.mp4"}) == "ffmpeg -i 'my video.mp4'");
    VIDSTORE_CHECK(vidstore::process::JoinArgs({}).empty());
}

}  // namespace

int main() {
    vidstore_test::Run("run capture", TestRunCapture);
    vidstore_test::Run("large read", TestLargeRead);
    vidstore_test::Run("stdin pipe", TestStdinPipe);
    vidstore_test::Run("non-zero exit", TestNonZeroExit);
    vidstore_test::Run("missing binary", TestMissingBinary);
    vidstore_test::Run("timeout", TestTimeout);
    vidstore_test::Run("reader exits early", TestReaderExitsEarly);
    vidstore_test::Run("join args", TestJoinArgs);
    return vidstore_test::Summary("test_process");
}

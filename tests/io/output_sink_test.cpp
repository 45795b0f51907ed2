// =============================================================================
// qpx - Output Sink Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include "qpx/io/output_sink.h"
#include "support/archive_builder.h"

namespace qpx::io::test {

using qpx::test::bytesOf;
using qpx::test::readFile;
using qpx::test::TempDir;
using qpx::test::writeFile;

TEST(FileSinkTest, WritesAtOffsetsOutOfOrder) {
    TempDir dir;
    const auto path = dir.path() / "out.bin";

    auto sink = FileSink::create(path);
    const auto second = bytesOf("world");
    const auto first = bytesOf("hello ");
    ASSERT_TRUE(sink->writeAt(second, 6).has_value());
    ASSERT_TRUE(sink->writeAt(first, 0).has_value());
    EXPECT_EQ(sink->bytesWritten(), 11U);
    ASSERT_TRUE(sink->close().has_value());

    EXPECT_EQ(readFile(path), "hello world");
    EXPECT_EQ(sink->describe(), path.string());
}

TEST(FileSinkTest, ConcurrentNonOverlappingWrites) {
    TempDir dir;
    const auto path = dir.path() / "blocks.bin";
    auto sink = FileSink::create(path);

    constexpr int kBlocks = 16;
    constexpr std::size_t kBlockSize = 4096;
    std::vector<std::thread> threads;
    for (int i = 0; i < kBlocks; ++i) {
        threads.emplace_back([&sink, i] {
            const ByteBuffer data(kBlockSize, static_cast<std::uint8_t>('a' + i));
            EXPECT_TRUE(sink->writeAt(data, static_cast<FileOffset>(i) * kBlockSize).has_value());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_TRUE(sink->close().has_value());

    const std::string content = readFile(path);
    ASSERT_EQ(content.size(), kBlocks * kBlockSize);
    for (int i = 0; i < kBlocks; ++i) {
        EXPECT_EQ(content[static_cast<std::size_t>(i) * kBlockSize], static_cast<char>('a' + i));
    }
}

TEST(FileSinkTest, RefusesExistingFileAndLeavesItUntouched) {
    TempDir dir;
    const auto path = dir.path() / "keep.txt";
    writeFile(path, "original");

    EXPECT_THROW((void)FileSink::create(path), AlreadyExistsError);
    EXPECT_EQ(readFile(path), "original");
}

TEST(FileSinkTest, MissingParentIsIOError) {
    TempDir dir;
    EXPECT_THROW((void)FileSink::create(dir.path() / "missing" / "x.txt"), IOError);
}

TEST(FileSinkTest, CreatedWithOwnerReadWrite) {
    TempDir dir;
    const auto path = dir.path() / "mode.txt";
    auto sink = FileSink::create(path);
    ASSERT_TRUE(sink->close().has_value());

    struct stat st {};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & S_IRUSR, static_cast<mode_t>(S_IRUSR));
    EXPECT_EQ(st.st_mode & S_IWUSR, static_cast<mode_t>(S_IWUSR));
    EXPECT_EQ(st.st_mode & S_IWOTH, static_cast<mode_t>(0));
}

TEST(FileSinkTest, WriteAfterCloseFails) {
    TempDir dir;
    auto sink = FileSink::create(dir.path() / "closed.txt");
    ASSERT_TRUE(sink->close().has_value());

    auto result = sink->writeAt(bytesOf("x"), 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

TEST(StreamSinkTest, AppendsInOrder) {
    std::ostringstream out;
    StreamSink sink(out);
    sink.beginFile("a");
    sink.write(bytesOf("hello"));
    sink.write(bytesOf("there"));
    sink.endFile("a");
    sink.flush();

    EXPECT_EQ(out.str(), "hellothere");
}

}  // namespace qpx::io::test

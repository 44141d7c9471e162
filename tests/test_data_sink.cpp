// ============================================================
// test_data_sink.cpp -- Memory and directory sinks
// ============================================================

#include "common/data_sink.hpp"
#include "common/errors.hpp"
#include "common/file_io.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <iterator>

using namespace testing_util;

namespace {

std::vector<u8> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // namespace

TEST(MemorySink, AppendsPerFileInWriteOrder) {
    MemorySink sink;
    sink.begin({FileDescriptor{"a", "a.txt", 5}, FileDescriptor{"b", "b.txt", 2}});
    sink.write("a", (const u8*)"he", 2);
    sink.write("b", (const u8*)"ok", 2);
    sink.write("a", (const u8*)"llo", 3);
    sink.end();

    EXPECT_EQ(sink.bytes("a"), bytes_of("hello"));
    EXPECT_EQ(sink.bytes("b"), bytes_of("ok"));
    EXPECT_TRUE(sink.ended());
    EXPECT_EQ(sink.files().size(), 2u);
}

TEST(MemorySink, UnknownIdIsRejected) {
    MemorySink sink;
    sink.begin({FileDescriptor{"a", "a.txt", 1}});
    EXPECT_THROW(sink.write("zzz", (const u8*)"x", 1), ProtocolError);
}

TEST(DirectorySink, WritesEachFileAtItsDeclaredLength) {
    auto dir = temp_dir("sink");
    DirectorySink sink(dir.string());
    std::vector<u8> big = random_bytes(100000, 5);

    sink.begin({FileDescriptor{"1", "small.txt", 5},
                FileDescriptor{"2", "nested/big.bin", big.size()},
                FileDescriptor{"3", "empty.dat", 0}});
    sink.write("1", (const u8*)"hello", 5);
    sink.write("2", big.data(), 60000);
    sink.write("2", big.data() + 60000, big.size() - 60000);
    sink.end();

    EXPECT_EQ(read_file((dir / "small.txt").string()), bytes_of("hello"));
    EXPECT_EQ(read_file((dir / "nested" / "big.bin").string()), big);
    EXPECT_TRUE(std::filesystem::exists(dir / "empty.dat"));
    EXPECT_EQ(std::filesystem::file_size(dir / "empty.dat"), 0u);
    std::filesystem::remove_all(dir);
}

TEST(DirectorySink, DuplicateNamesGetNumberedCopies) {
    auto dir = temp_dir("dup");
    DirectorySink sink(dir.string());
    sink.begin({FileDescriptor{"1", "doc.txt", 1}, FileDescriptor{"2", "doc.txt", 1}});
    EXPECT_NE(sink.path_of("1"), sink.path_of("2"));
    EXPECT_EQ(std::filesystem::path(sink.path_of("2")).filename().string(), "doc (1).txt");
    sink.write("1", (const u8*)"a", 1);
    sink.write("2", (const u8*)"b", 1);
    sink.end();
    std::filesystem::remove_all(dir);
}

TEST(DirectorySink, ExistingFileIsNeverOverwritten) {
    auto dir = temp_dir("keep");
    {
        std::ofstream f(dir / "report.txt", std::ios::binary);
        f << "PRECIOUS EXISTING CONTENT";
    }
    DirectorySink sink(dir.string());
    sink.begin({FileDescriptor{"a", "report.txt", 3}});
    EXPECT_EQ(std::filesystem::path(sink.path_of("a")).filename().string(), "report (1).txt");
    sink.write("a", (const u8*)"new", 3);
    sink.end();

    EXPECT_EQ(read_file((dir / "report.txt").string()), bytes_of("PRECIOUS EXISTING CONTENT"));
    EXPECT_EQ(read_file((dir / "report (1).txt").string()), bytes_of("new"));
    std::filesystem::remove_all(dir);
}

TEST(DirectorySink, NumberingSkipsNamesOnDiskAndInOffer) {
    auto dir = temp_dir("skip");
    { std::ofstream f(dir / "doc.txt"); }
    { std::ofstream f(dir / "doc (1).txt"); }
    DirectorySink sink(dir.string());
    sink.begin({FileDescriptor{"1", "doc.txt", 1}, FileDescriptor{"2", "doc.txt", 1}});
    EXPECT_EQ(std::filesystem::path(sink.path_of("1")).filename().string(), "doc (2).txt");
    EXPECT_EQ(std::filesystem::path(sink.path_of("2")).filename().string(), "doc (3).txt");
    sink.write("1", (const u8*)"a", 1);
    sink.write("2", (const u8*)"b", 1);
    sink.end();
    std::filesystem::remove_all(dir);
}

TEST(DirectorySink, RejectsNamesEscapingTheRoot) {
    auto dir = temp_dir("escape");
    {
        DirectorySink sink(dir.string());
        EXPECT_THROW(sink.begin({FileDescriptor{"1", "../evil.txt", 1}}), ProtocolError);
    }
    {
        DirectorySink sink(dir.string());
        EXPECT_THROW(sink.begin({FileDescriptor{"1", "/etc/passwd", 1}}), ProtocolError);
    }
    {
        DirectorySink sink(dir.string());
        EXPECT_THROW(sink.begin({FileDescriptor{"1", "", 1}}), ProtocolError);
    }
    {
        DirectorySink sink(dir.string());
        EXPECT_THROW(sink.begin({FileDescriptor{"1", ".", 1}}), ProtocolError);
    }
    EXPECT_FALSE(std::filesystem::exists(dir.parent_path() / "evil.txt"));
    std::filesystem::remove_all(dir);
}

TEST(DirectorySink, OverrunIsRejected) {
    auto dir = temp_dir("overrun");
    DirectorySink sink(dir.string());
    sink.begin({FileDescriptor{"1", "f.bin", 3}});
    sink.write("1", (const u8*)"ab", 2);
    EXPECT_THROW(sink.write("1", (const u8*)"cd", 2), ProtocolError);
    std::filesystem::remove_all(dir);
}

TEST(SafeJoin, KeepsNamesUnderRoot) {
    EXPECT_EQ(file_io::safe_join("/data/in", "a/b.txt").string(), "/data/in/a/b.txt");
    EXPECT_THROW(file_io::safe_join("/data/in", "a/../../x"), std::invalid_argument);
    EXPECT_THROW(file_io::safe_join("/data/in", "."), std::invalid_argument);
    EXPECT_THROW(file_io::safe_join("/data/in", "a/."), std::invalid_argument);
    EXPECT_THROW(file_io::safe_join("/data/in/", "./"), std::invalid_argument);
    EXPECT_EQ(file_io::safe_join("/data/in", "./a.txt").string(), "/data/in/a.txt");
}

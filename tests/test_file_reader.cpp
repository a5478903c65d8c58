#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "testing.hpp"

#include <cerrno>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

class FileIoTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(FileIoTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = tmp.File("in.bin");
    std::string data(12345, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i & 0xFF);
    testutil::WriteFile(p, data);

    geoupdate::FileReader r;
    auto res = geoupdate::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());

    std::vector<std::uint8_t> all;
    ASSERT_TRUE(geoupdate::ReadToEnd(r, all).is_ok());
    EXPECT_EQ(testutil::Text(all), data);
}

TEST_F(FileIoTests, OpenNonexistent_Fails) {
    geoupdate::FileReader r;
    auto res = geoupdate::FileReader::Open(tmp.File("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileIoTests, OpenDirectory_Fails) {
    geoupdate::FileReader r;
    auto res = geoupdate::FileReader::Open(tmp.Path(), r);
    EXPECT_FALSE(res.ok);
}

TEST_F(FileIoTests, ReadToEndHonoursLimit) {
    const std::string p = tmp.File("big.bin");
    testutil::WriteFile(p, std::string(4096, 'x'));

    geoupdate::FileReader r;
    ASSERT_TRUE(geoupdate::FileReader::Open(p, r).is_ok());

    std::vector<std::uint8_t> out;
    auto res = geoupdate::ReadToEnd(r, out, 1024);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, EFBIG);
}

TEST_F(FileIoTests, WriterCreatesFileWithMode) {
    const std::string p = tmp.File("out.bin");
    geoupdate::FileWriter w;
    ASSERT_TRUE(geoupdate::FileWriter::Open(p, 0600, w).is_ok());

    const auto data = testutil::Bytes("payload");
    ASSERT_TRUE(w.WriteAll(data).is_ok());
    ASSERT_TRUE(w.FsyncNow().is_ok());
    ASSERT_TRUE(w.Close().is_ok());

    EXPECT_EQ(testutil::ReadFile(p), "payload");
    struct stat st{};
    ASSERT_EQ(::stat(p.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(FileIoTests, WriterTruncatesExistingFile) {
    const std::string p = tmp.File("out.bin");
    testutil::WriteFile(p, "a much longer previous content");

    geoupdate::FileWriter w;
    ASSERT_TRUE(geoupdate::FileWriter::Open(p, 0644, w).is_ok());
    ASSERT_TRUE(w.WriteAll(testutil::Bytes("new")).is_ok());
    ASSERT_TRUE(w.Close().is_ok());

    EXPECT_EQ(testutil::ReadFile(p), "new");
}

TEST_F(FileIoTests, WriterOpenInMissingDirectoryFails) {
    geoupdate::FileWriter w;
    auto res = geoupdate::FileWriter::Open(tmp.File("missing/out.bin"), 0644, w);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
}

} // namespace

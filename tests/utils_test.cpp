/**
 * @file utils_test.cpp
 * @brief 工具函数测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include "core/utils.h"

using namespace sjudge;

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  ok \n"), "ok");
    EXPECT_EQ(trim("\r\n\t"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(UtilsTest, PreviewCountsCodePoints) {
    EXPECT_EQ(preview("abcdef", 3), "abc");
    EXPECT_EQ(preview("ab", 10), "ab");
    // 两个字符都是 3 字节的 UTF-8
    EXPECT_EQ(preview("\xE4\xBD\xA0\xE5\xA5\xBD", 1), "\xE4\xBD\xA0");
}

TEST(UtilsTest, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("ok"), "ok");
    EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    // 截断的多字节序列
    EXPECT_EQ(sanitize_utf8("\xE4\xBD"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitize_utf8("\xE4\xBD\xA0"), "\xE4\xBD\xA0");
}

TEST(UtilsTest, QuoteRepr) {
    EXPECT_EQ(quote_repr("abc"), "'abc'");
    EXPECT_EQ(quote_repr("it's"), "\"it's\"");
    EXPECT_EQ(quote_repr("a\tb\n"), "'a\\tb\\n'");
    EXPECT_EQ(quote_repr("/tmp/x\\y"), "'/tmp/x\\\\y'");
}

TEST(UtilsTest, Utf8Length) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("\xE4\xBD\xA0\xE5\xA5\xBD"), 2u);
    EXPECT_EQ(utf8_length("a\xff" "b"), 3u);
}

TEST(UtilsTest, XmlEscape) {
    EXPECT_EQ(xml_escape("<a href=\"x\">&</a>"), "&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;");
    EXPECT_EQ(xml_escape("it's"), "it&apos;s");
    EXPECT_EQ(xml_escape("a\tb\r\nc"), "a\tb\r\nc");
}

TEST(UtilsTest, XmlEscapeReplacesIllegalCharacters) {
    EXPECT_EQ(xml_escape(std::string("a\0b\x01", 4)), "a\xEF\xBF\xBD" "b\xEF\xBF\xBD");
    EXPECT_EQ(xml_escape("\x1b[31m"), "\xEF\xBF\xBD[31m");
    EXPECT_EQ(xml_escape("\xff"), "\xEF\xBF\xBD");
    EXPECT_EQ(xml_escape("\xE4\xBD\xA0"), "\xE4\xBD\xA0");
}

TEST(UtilsTest, ScratchDirIsRemovedOnDestruction) {
    std::string path;
    {
        auto created = ScratchDir::create("/tmp", "sjudge_utils_test_");
        ASSERT_TRUE(created.ok()) << created.error().to_string();
        ScratchDir dir = std::move(created).value();
        path = dir.path();
        ASSERT_TRUE(std::filesystem::is_directory(path));
        ASSERT_TRUE(write_file(dir.file("nested.txt"), "data").ok());
        std::filesystem::create_directory(dir.file("sub"));
        ASSERT_TRUE(write_file(dir.file("sub/inner.txt"), "data").ok());
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(UtilsTest, ScratchDirCreateFailsUnderMissingRoot) {
    auto created = ScratchDir::create("/nonexistent/sjudge_root");
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code(), ErrorCode::FILE_WRITE_ERROR);
}

TEST(UtilsTest, ReadWriteFile) {
    std::string path = "/tmp/sjudge_utils_rw.txt";
    ASSERT_TRUE(write_file(path, "line1\nline2").ok());
    auto content = read_file(path);
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), "line1\nline2");
    std::filesystem::remove(path);

    auto missing = read_file("/tmp/sjudge_definitely_missing_file");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::FILE_READ_ERROR);
}

TEST(UtilsTest, FindInPath) {
    EXPECT_EQ(find_in_path("/bin/sh"), "/bin/sh");
    EXPECT_FALSE(find_in_path("sh").empty());
    EXPECT_TRUE(find_in_path("sjudge-no-such-command").empty());
}

//
// Created by gregorian-rayne on 02/09/26.
//

#include <gtest/gtest.h>
#include "covscope/utils/file_utils.hpp"
#include <filesystem>
#include <fstream>

using namespace covscope;
using namespace covscope::file_utils;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "covscope_file_utils_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_test_file(const fs::path& relative, const std::string& content) const {
        const auto path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
        file.close();
    }

    fs::path temp_dir;
};

TEST_F(FileUtilsTest, ReadFile_ExistingFile) {
    create_test_file("test.txt", "Report Path: build/a.xml");

    const auto content = read_file(temp_dir / "test.txt");

    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value(), "Report Path: build/a.xml");
}

TEST_F(FileUtilsTest, ReadFile_MissingFile) {
    const auto content = read_file(temp_dir / "absent.txt");

    ASSERT_TRUE(content.is_err());
    EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
}

TEST_F(FileUtilsTest, WriteFile_CreatesParents) {
    const auto target = temp_dir / "nested" / "deeper" / "out.json";

    const auto written = write_file(target, "{}");

    ASSERT_TRUE(written.is_ok());
    EXPECT_TRUE(file_utils::is_regular_file(target));
    EXPECT_EQ(read_file(target).value(), "{}");
}

TEST_F(FileUtilsTest, TypeChecks) {
    create_test_file("a.xml", "<report/>");

    EXPECT_TRUE(file_utils::is_regular_file(temp_dir / "a.xml"));
    EXPECT_FALSE(file_utils::is_regular_file(temp_dir));
    EXPECT_TRUE(file_utils::is_directory(temp_dir));
    EXPECT_FALSE(file_utils::is_directory(temp_dir / "a.xml"));
    EXPECT_FALSE(file_utils::is_regular_file(temp_dir / "missing"));
}

TEST_F(FileUtilsTest, NormalizeRemovesDotSegments) {
    const auto messy = temp_dir / "module" / ".." / "build" / "." / "report.xml";

    const auto normalized = normalize(messy);

    EXPECT_TRUE(normalized.is_absolute());
    EXPECT_EQ(normalized.string(), (temp_dir / "build" / "report.xml").lexically_normal().string());
}

TEST_F(FileUtilsTest, FindFilesNamed_SortedAndExact) {
    create_test_file("b/build/reports/jacoco/test/jacocoTestReport.xml", "<report/>");
    create_test_file("a/build/reports/jacoco/test/jacocoTestReport.xml", "<report/>");
    create_test_file("a/build/reports/jacoco/test/jacocoTestReport.xml.bak", "");
    create_test_file("c/other.xml", "<report/>");

    const auto found = find_files_named(temp_dir, "jacocoTestReport.xml");

    ASSERT_TRUE(found.is_ok());
    ASSERT_EQ(found.value().size(), 2u);
    EXPECT_LT(found.value()[0].string(), found.value()[1].string());
    for (const auto& path : found.value()) {
        EXPECT_EQ(path.filename().string(), "jacocoTestReport.xml");
    }
}

TEST_F(FileUtilsTest, FindFilesNamed_NoMatches) {
    const auto found = find_files_named(temp_dir, "jacocoTestReport.xml");

    ASSERT_TRUE(found.is_ok());
    EXPECT_TRUE(found.value().empty());
}

TEST_F(FileUtilsTest, FindFilesNamed_MissingDirectory) {
    const auto found = find_files_named(temp_dir / "nope", "x.xml");

    ASSERT_TRUE(found.is_err());
    EXPECT_EQ(found.error().code(), ErrorCode::NotFound);
}

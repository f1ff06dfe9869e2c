// Command-line front end tests
//
// Argument handling, pre-check ordering and the completion notice.

#include "SortCommand.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class SortCommandTest : public ::testing::Test {
protected:
    fs::path temp_dir_;
    fs::path source_dir_;
    fs::path previous_cwd_;
    std::ostringstream out_;
    std::ostringstream err_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = fs::temp_directory_path() / (std::string("extension_sorter_cmd_") + info->name());
        fs::remove_all(temp_dir_);
        source_dir_ = temp_dir_ / "source";
        fs::create_directories(source_dir_);
        previous_cwd_ = fs::current_path();
    }

    void TearDown() override {
        std::error_code ec;
        fs::current_path(previous_cwd_, ec);
        fs::remove_all(temp_dir_, ec);
    }

    static void touch(const fs::path& path) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << "x";
    }

    int run(const std::vector<std::string>& args) { return runSorter(args, out_, err_); }
};

// ============================================================================
// Run-aborting checks
// ============================================================================

TEST_F(SortCommandTest, FileSourceAbortsBeforeDestinationIsCreated) {
    touch(temp_dir_ / "plain.txt");
    const fs::path dest = temp_dir_ / "dist";

    EXPECT_EQ(run({(temp_dir_ / "plain.txt").string(), dest.string()}), EXIT_FAILURE);

    EXPECT_FALSE(fs::exists(dest));
    EXPECT_TRUE(fs::exists(temp_dir_ / "plain.txt"));
    EXPECT_NE(err_.str().find("not a directory"), std::string::npos);
}

TEST_F(SortCommandTest, FileSourceDoesNotCreateDefaultDestination) {
    touch(temp_dir_ / "plain.txt");
    fs::current_path(temp_dir_);

    EXPECT_EQ(run({"plain.txt"}), EXIT_FAILURE);

    EXPECT_FALSE(fs::exists(temp_dir_ / "dist"));
}

TEST_F(SortCommandTest, MissingSourceAborts) {
    const fs::path dest = temp_dir_ / "dist";

    EXPECT_EQ(run({(temp_dir_ / "absent").string(), dest.string()}), EXIT_FAILURE);

    EXPECT_FALSE(fs::exists(dest));
    EXPECT_NE(err_.str().find("does not exist"), std::string::npos);
}

TEST_F(SortCommandTest, UncreatableDestinationAbortsWithoutMoving) {
    touch(source_dir_ / "a.txt");
    touch(temp_dir_ / "blocker");

    EXPECT_EQ(run({source_dir_.string(), (temp_dir_ / "blocker" / "dist").string()}), EXIT_FAILURE);

    EXPECT_TRUE(fs::exists(source_dir_ / "a.txt"));
    EXPECT_NE(err_.str().find("Failed to create destination directory"), std::string::npos);
}

TEST_F(SortCommandTest, BadConfigAbortsBeforeAnything) {
    touch(source_dir_ / "a.txt");
    const fs::path dest = temp_dir_ / "dist";

    EXPECT_EQ(run({source_dir_.string(), dest.string(), "--config", (temp_dir_ / "none.json").string()}), EXIT_FAILURE);

    EXPECT_FALSE(fs::exists(dest));
    EXPECT_TRUE(fs::exists(source_dir_ / "a.txt"));
}

// ============================================================================
// Arguments
// ============================================================================

TEST_F(SortCommandTest, UsageErrors) {
    EXPECT_EQ(run({}), EXIT_FAILURE);
    EXPECT_EQ(run({"a", "b", "c"}), EXIT_FAILURE);
    EXPECT_EQ(run({"--bogus", "a"}), EXIT_FAILURE);
    EXPECT_EQ(run({"a", "--config"}), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(SortCommandTest, HelpPrintsUsage) {
    EXPECT_EQ(run({"--help"}), EXIT_SUCCESS);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
}

// ============================================================================
// Completed runs
// ============================================================================

TEST_F(SortCommandTest, EmptySourceCompletesWithoutBuckets) {
    const fs::path dest = temp_dir_ / "dist";

    EXPECT_EQ(run({source_dir_.string(), dest.string()}), EXIT_SUCCESS);

    EXPECT_TRUE(fs::is_directory(dest));
    EXPECT_TRUE(fs::is_empty(dest));
    EXPECT_NE(out_.str().find("Done: moved 0 file(s)"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(SortCommandTest, DefaultDestinationIsDistInWorkingDirectory) {
    touch(source_dir_ / "nested" / "note.md");
    fs::current_path(temp_dir_);

    EXPECT_EQ(run({"source"}), EXIT_SUCCESS);

    EXPECT_TRUE(fs::exists(temp_dir_ / "dist" / "md" / "note.md"));
    EXPECT_NE(out_.str().find("Done: moved 1 file(s)"), std::string::npos);
}

TEST_F(SortCommandTest, PartialFailureStillCompletes) {
    touch(source_dir_ / "a.txt");
    touch(source_dir_ / "b.txt");
    const fs::path dest = temp_dir_ / "dist";
    fs::create_directories(dest / "txt" / "b.txt");

    EXPECT_EQ(run({source_dir_.string(), dest.string()}), EXIT_SUCCESS);

    EXPECT_TRUE(fs::exists(dest / "txt" / "a.txt"));
    EXPECT_NE(err_.str().find("b.txt"), std::string::npos);
    EXPECT_NE(err_.str().find("1 problem(s) reported"), std::string::npos);
}

TEST_F(SortCommandTest, SourceAsDestinationSortsInPlace) {
    touch(source_dir_ / "a.TXT");
    touch(source_dir_ / "sub" / "b.md");

    EXPECT_EQ(run({source_dir_.string(), source_dir_.string()}), EXIT_SUCCESS);

    EXPECT_TRUE(fs::exists(source_dir_ / "txt" / "a.TXT"));
    EXPECT_TRUE(fs::exists(source_dir_ / "md" / "b.md"));
}

TEST_F(SortCommandTest, VerboseConfigPrintsEachMove) {
    touch(source_dir_ / "song.mp3");
    const fs::path config = temp_dir_ / "sorter.json";
    {
        std::ofstream out(config);
        out << R"({"verbose": true})";
    }

    EXPECT_EQ(run({source_dir_.string(), (temp_dir_ / "dist").string(), "--config", config.string()}), EXIT_SUCCESS);

    EXPECT_NE(out_.str().find("Moved `"), std::string::npos);
    EXPECT_NE(out_.str().find("song.mp3"), std::string::npos);
}

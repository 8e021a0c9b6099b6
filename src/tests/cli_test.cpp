#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "store/memory_database.hpp"
#include "test_utils.hpp"

using namespace gridstore;

class CLITest : public ::testing::Test {
protected:
  void SetUp() override {
    quiet_logging();
    work_dir = std::filesystem::temp_directory_path() / "gridstore_cli_test";
    std::filesystem::remove_all(work_dir);
    std::filesystem::create_directories(work_dir);

    database = std::make_unique<store::MemoryDatabase>();
    fs = std::make_unique<grid::FS>(*database);
    cli = std::make_unique<cli::CLI>(*fs, 4);
  }

  void TearDown() override {
    std::filesystem::remove_all(work_dir);
  }

  std::string write_local(const std::string& name, const std::string& content) {
    auto path = work_dir / name;
    std::ofstream output(path, std::ios::binary);
    output << content;
    return path.string();
  }

  std::string read_local(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    std::stringstream content;
    content << input.rdbuf();
    return content.str();
  }

  // Runs one line and returns what the shell printed
  std::string run(const std::string& line, bool expect_continue = true) {
    ::testing::internal::CaptureStdout();
    bool keep_running = cli->execute(line);
    std::string output = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(keep_running, expect_continue) << line;
    return output;
  }

  std::filesystem::path work_dir;
  std::unique_ptr<store::MemoryDatabase> database;
  std::unique_ptr<grid::FS> fs;
  std::unique_ptr<cli::CLI> cli;
};

TEST_F(CLITest, PutThenGet) {
  std::string source = write_local("notes.txt", "hello gridstore");
  std::string output = run("put " + source);
  EXPECT_NE(output.find("Stored notes.txt"), std::string::npos);
  EXPECT_NE(output.find("4 chunks"), std::string::npos);
  EXPECT_NE(output.find("checksum verified"), std::string::npos);

  std::string target = (work_dir / "copy.txt").string();
  run("get notes.txt " + target);
  EXPECT_EQ(read_local(target), "hello gridstore");

  EXPECT_NE(run("cat notes.txt").find("hello gridstore"), std::string::npos);
  EXPECT_NE(run("check notes.txt").find("OK"), std::string::npos);
}

TEST_F(CLITest, ListAndRemove) {
  run("put " + write_local("a.txt", "aaa"));
  run("put " + write_local("b.txt", "bbbbbb"));

  std::string listing = run("ls");
  EXPECT_NE(listing.find("a.txt"), std::string::npos);
  EXPECT_NE(listing.find("b.txt"), std::string::npos);

  EXPECT_NE(run("rm a.txt").find("Removed a.txt"), std::string::npos);
  EXPECT_EQ(run("ls").find("a.txt"), std::string::npos);
  EXPECT_NE(run("rm a.txt").find("File not found"), std::string::npos);
}

TEST_F(CLITest, SweepReportsOrphans) {
  run("put " + write_local("a.txt", "abcdefgh"));
  fs->files_collection().find().remove_many();

  EXPECT_NE(run("sweep").find("2 orphaned chunk records"), std::string::npos);
  EXPECT_EQ(fs->chunks_collection().find().count(), 0u);
}

TEST_F(CLITest, InvalidInput) {
  EXPECT_NE(run("put").find("Invalid input"), std::string::npos);
  EXPECT_NE(run("frobnicate x").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("put " + (work_dir / "missing").string()).find("Error opening file"),
            std::string::npos);
  EXPECT_EQ(run(""), "");
}

TEST_F(CLITest, QuitStopsShell) {
  run("quit", false);
  run("exit", false);
  EXPECT_NE(run("help").find("Available commands"), std::string::npos);
}

#include <gtest/gtest.h>
#include "../../src/io/file_store.h"
#include "../../src/common/errors.h"

#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <unistd.h>

using namespace Rendezvous;

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir[] = "/tmp/rendezvous_file_store_XXXXXX";
        ASSERT_NE(mkdtemp(dir), nullptr);
        dir_ = dir;
        path_ = dir_ + "/people.csv";
        executor_ = std::make_unique<TaskExecutor>(2);
    }

    void TearDown() override {
        executor_.reset();
        unlink(path_.c_str());
        rmdir(dir_.c_str());
    }

    void WriteRaw(const std::string& content) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    std::string ReadRaw() {
        std::ifstream in(path_, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::string dir_;
    std::string path_;
    std::unique_ptr<TaskExecutor> executor_;
};

TEST_F(FileStoreTest, ReadsLinesInOrder) {
    WriteRaw("Ada,Lovelace,36\nAlan,Turing,41\nGrace,Hopper,85");
    std::vector<std::string> expected = {"Ada,Lovelace,36", "Alan,Turing,41", "Grace,Hopper,85"};
    EXPECT_EQ(ReadLinesFromFile(path_), expected);
}

TEST_F(FileStoreTest, TrailingNewlineAddsNoLine) {
    WriteRaw("Ada,Lovelace,36\nAlan,Turing,41\n");
    EXPECT_EQ(ReadLinesFromFile(path_).size(), 2u);
}

TEST_F(FileStoreTest, StripsCarriageReturns) {
    WriteRaw("Ada,Lovelace,36\r\nAlan,Turing,41\r\n");
    std::vector<std::string> expected = {"Ada,Lovelace,36", "Alan,Turing,41"};
    EXPECT_EQ(ReadLinesFromFile(path_), expected);
}

TEST_F(FileStoreTest, EmptyFileHasNoLines) {
    WriteRaw("");
    EXPECT_TRUE(ReadLinesFromFile(path_).empty());
}

TEST_F(FileStoreTest, InnerBlankLineIsKept) {
    WriteRaw("Ada,Lovelace,36\n\nAlan,Turing,41");
    EXPECT_EQ(ReadLinesFromFile(path_).size(), 3u);
}

TEST_F(FileStoreTest, MissingFileIsIOError) {
    try {
        ReadLinesFromFile(dir_ + "/missing.csv");
        FAIL() << "expected an IOError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kIOError);
        EXPECT_NE(std::string(e.what()).find("missing.csv"), std::string::npos);
    }
}

TEST_F(FileStoreTest, WriteHasNoTrailingNewlineAndTruncates) {
    WriteRaw("a much longer previous content that must disappear entirely");
    WriteLinesToFile(path_, {"Ada,Lovelace,38", "Alan,Turing,43"});
    EXPECT_EQ(ReadRaw(), "Ada,Lovelace,38\nAlan,Turing,43");

    WriteLinesToFile(path_, {});
    EXPECT_EQ(ReadRaw(), "");
}

TEST_F(FileStoreTest, WriteIntoMissingDirectoryIsIOError) {
    EXPECT_THROW(WriteLinesToFile(dir_ + "/no/such/dir.csv", {"x"}), PipelineError);
}

TEST_F(FileStoreTest, ProviderAndSinkRunOnExecutor) {
    WriteRaw("Frodo,Baggins,50");
    FileSourceProvider source(path_, *executor_);
    FileSink sink(path_, *executor_);

    std::vector<std::string> lines = source.FetchLines().Get();
    ASSERT_EQ(lines.size(), 1u);

    sink.Write({"Frodo,Baggins,48"}).Get();
    EXPECT_EQ(ReadRaw(), "Frodo,Baggins,48");
    EXPECT_EQ(source.path(), path_);
}

TEST_F(FileStoreTest, ProviderFailureIsCarriedByValue) {
    FileSourceProvider source(dir_ + "/missing.csv", *executor_);
    Outcome<std::vector<std::string>> outcome = source.FetchLines().Wait();
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(DescribeError(outcome.error()).rfind("IOError:", 0), 0u);
}

#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/core/Error.h"

#include <gtest/gtest.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

using namespace pyhazard;

namespace {

ErrorKind kindOf(llvm::Error err) {
    ErrorKind kind = ErrorKind::Input;
    llvm::handleAllErrors(std::move(err), [&](const AnalysisError &e) { kind = e.kind(); });
    return kind;
}

class SourceLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("pyhazard-root", root_));
        ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("pyhazard-outside", outside_));
    }

    void TearDown() override {
        llvm::sys::fs::remove_directories(root_);
        llvm::sys::fs::remove_directories(outside_);
    }

    std::string write(llvm::StringRef dir, llvm::StringRef name, llvm::StringRef text) {
        llvm::SmallString<256> path(dir);
        llvm::sys::path::append(path, name);
        llvm::sys::fs::create_directories(llvm::sys::path::parent_path(path));
        std::error_code ec;
        llvm::raw_fd_ostream os(path, ec);
        EXPECT_FALSE(ec) << ec.message();
        os << text;
        return path.str().str();
    }

    LoadOptions options(size_t maxLines = 10000) const {
        LoadOptions opts;
        opts.projectRoot = root_.str().str();
        opts.maxLines = maxLines;
        return opts;
    }

    llvm::SmallString<128> root_;
    llvm::SmallString<128> outside_;
};

} // anonymous namespace

TEST(CountLinesTest, CountsFinalUnterminatedLine) {
    EXPECT_EQ(countLines(""), 0u);
    EXPECT_EQ(countLines("x = 1"), 1u);
    EXPECT_EQ(countLines("x = 1\n"), 1u);
    EXPECT_EQ(countLines("x = 1\ny = 2"), 2u);
    EXPECT_EQ(countLines("\n\n\n"), 3u);
}

TEST_F(SourceLoaderTest, LoadsFileInsideRoot) {
    std::string path = write(root_, "app/models.py", "x = 1\ny = 2\n");
    auto file = loadSource(path, options());
    ASSERT_TRUE(static_cast<bool>(file)) << llvm::toString(file.takeError());
    EXPECT_EQ(file->content, "x = 1\ny = 2\n");
    EXPECT_EQ(file->lineCount, 2u);
    EXPECT_TRUE(llvm::sys::path::is_absolute(file->path));
}

TEST_F(SourceLoaderTest, RelativePathResolvesAgainstRoot) {
    write(root_, "pkg/util.py", "def f():\n    return 1\n");
    auto file = loadSource("pkg/util.py", options());
    ASSERT_TRUE(static_cast<bool>(file)) << llvm::toString(file.takeError());
    EXPECT_EQ(llvm::sys::path::filename(file->path), "util.py");
}

TEST_F(SourceLoaderTest, RejectsOtherExtensions) {
    std::string path = write(root_, "notes.txt", "hello\n");
    auto file = loadSource(path, options());
    ASSERT_FALSE(static_cast<bool>(file));
    EXPECT_EQ(kindOf(file.takeError()), ErrorKind::Access);

    std::string stub = write(root_, "types.pyi", "x: int\n");
    auto ok = loadSource(stub, options());
    EXPECT_TRUE(static_cast<bool>(ok));
    if (!ok)
        llvm::consumeError(ok.takeError());
}

TEST_F(SourceLoaderTest, RejectsPathOutsideRoot) {
    std::string path = write(outside_, "evil.py", "import os\n");
    auto file = loadSource(path, options());
    ASSERT_FALSE(static_cast<bool>(file));
    EXPECT_EQ(kindOf(file.takeError()), ErrorKind::Access);

    auto escaped = loadSource("../" + llvm::sys::path::filename(outside_).str() +
                                  "/evil.py",
                              options());
    ASSERT_FALSE(static_cast<bool>(escaped));
    EXPECT_EQ(kindOf(escaped.takeError()), ErrorKind::Access);
}

TEST_F(SourceLoaderTest, EmptyRootSkipsContainment) {
    std::string path = write(outside_, "tool.py", "print('hi')\n");
    LoadOptions opts;
    auto file = loadSource(path, opts);
    EXPECT_TRUE(static_cast<bool>(file));
    if (!file)
        llvm::consumeError(file.takeError());
}

TEST_F(SourceLoaderTest, RejectsMissingFile) {
    llvm::SmallString<256> path(root_);
    llvm::sys::path::append(path, "missing.py");
    auto file = loadSource(path, options());
    ASSERT_FALSE(static_cast<bool>(file));
    EXPECT_EQ(kindOf(file.takeError()), ErrorKind::Access);
}

TEST_F(SourceLoaderTest, EnforcesLineLimit) {
    std::string text;
    for (int i = 0; i < 12; ++i)
        text += "x = " + std::to_string(i) + "\n";
    std::string path = write(root_, "big.py", text);

    auto rejected = loadSource(path, options(10));
    ASSERT_FALSE(static_cast<bool>(rejected));
    EXPECT_EQ(kindOf(rejected.takeError()), ErrorKind::Access);

    auto accepted = loadSource(path, options(12));
    ASSERT_TRUE(static_cast<bool>(accepted)) << llvm::toString(accepted.takeError());
    EXPECT_EQ(accepted->lineCount, 12u);
}

TEST_F(SourceLoaderTest, EnforcesByteLimit) {
    std::string path = write(root_, "wide.py", "x = '" + std::string(200, 'a') + "'\n");

    LoadOptions tight = options();
    tight.maxBytes = 64;
    auto rejected = loadSource(path, tight);
    ASSERT_FALSE(static_cast<bool>(rejected));
    EXPECT_EQ(kindOf(rejected.takeError()), ErrorKind::Access);

    LoadOptions roomy = options();
    roomy.maxBytes = 207;
    auto accepted = loadSource(path, roomy);
    ASSERT_TRUE(static_cast<bool>(accepted)) << llvm::toString(accepted.takeError());
    EXPECT_EQ(accepted->lineCount, 1u);
}

TEST_F(SourceLoaderTest, RejectsEmptyPath) {
    auto file = loadSource("", options());
    ASSERT_FALSE(static_cast<bool>(file));
    EXPECT_EQ(kindOf(file.takeError()), ErrorKind::Access);
}

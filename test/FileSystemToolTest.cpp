#include "BaseTestFixture.h"
#include "FileSystemTool.hpp"

// --- Scanning ---

class FileSystemToolTest : public BaseTestFixture {};

TEST_F(FileSystemToolTest, GetImageFilesRecursive) {
    auto files = FSETool::getImageFiles(tempDir, true);

    std::vector<std::string> expected = {
        fs::absolute(sharp_png).string(),
        fs::absolute(sharpCopy_png).string(),
        fs::absolute(small_jpg).string(),
        fs::absolute(circle_bmp).string(),
        fs::absolute(upper_JPG).string(),
        fs::absolute(corrupt_jpg).string(),
        fs::absolute(nested_png).string(),
    };
    ASSERT_EQ(files, expected);
}

TEST_F(FileSystemToolTest, GetImageFilesNonRecursive) {
    auto files = FSETool::getImageFiles(tempDir, false);

    ASSERT_EQ(files.size(), 6);
    for (const auto& f : files) {
        ASSERT_EQ(f.find("subdirectory"), std::string::npos) << f;
    }
}

TEST_F(FileSystemToolTest, LoopingSymlinkDoesNotAbortScan) {
    // "loop" points at itself, so resolving it fails with ELOOP
    fs::path loop = subdirPath / "loop";
    fs::create_symlink("loop", loop);
    fs::path topLevel = tempDir / "g_after.jpg";
    writeImage(topLevel, solidImage(50, 50, 128));

    auto files = FSETool::getImageFiles(tempDir, true);

    ASSERT_EQ(files.size(), 8);
    ASSERT_NE(std::find(files.begin(), files.end(), fs::absolute(nested_png).string()), files.end());
    ASSERT_NE(std::find(files.begin(), files.end(), fs::absolute(topLevel).string()), files.end());
    ASSERT_EQ(std::find(files.begin(), files.end(), fs::absolute(loop).string()), files.end());
    ASSERT_TRUE(std::is_sorted(files.begin(), files.end()));

    ASSERT_EQ(FSETool::getImageFiles(subdirPath, false),
              std::vector<std::string>{fs::absolute(nested_png).string()});
}

TEST_F(FileSystemToolTest, ExtensionMatchIsCaseInsensitive) {
    ASSERT_TRUE(FSETool::hasSupportedExtension("photo.JPG"));
    ASSERT_TRUE(FSETool::hasSupportedExtension("photo.Tiff"));
    ASSERT_TRUE(FSETool::hasSupportedExtension("/a/b/photo.jpeg"));
    ASSERT_FALSE(FSETool::hasSupportedExtension("readme.txt"));
    ASSERT_FALSE(FSETool::hasSupportedExtension("photo.gif"));
    ASSERT_FALSE(FSETool::hasSupportedExtension("jpg"));
}

TEST_F(FileSystemToolTest, MissingDirectoryYieldsNoFiles) {
    ASSERT_TRUE(FSETool::getImageFiles(tempDir / "does_not_exist").empty());
}

TEST_F(FileSystemToolTest, CreateDirectoryMakesParents) {
    fs::path nested = outputDir / "a" / "b";
    FSETool::createDirectory(nested);
    ASSERT_TRUE(fs::is_directory(nested));

    // Existing directory is fine
    ASSERT_NO_THROW(FSETool::createDirectory(nested));
}

TEST_F(FileSystemToolTest, CreateDirectoryUnderFileFails) {
    ASSERT_THROW(FSETool::createDirectory(readme_txt / "child"), IOFailure);
}

TEST_F(FileSystemToolTest, RelativeToKeepsSubdirectories) {
    ASSERT_EQ(FSETool::relativeTo(nested_png, tempDir), fs::path("subdirectory") / "nested.png");
    ASSERT_EQ(FSETool::relativeTo(sharp_png, tempDir), fs::path("a_sharp.png"));
}

TEST_F(FileSystemToolTest, RelativeToOutsideRootUsesFileName) {
    ASSERT_EQ(FSETool::relativeTo(sharp_png, subdirPath), fs::path("a_sharp.png"));
}

// --- Actions ---

TEST(TransferActionTest, ParsesNames) {
    ASSERT_EQ(parseTransferAction("report"), TransferAction::Report);
    ASSERT_EQ(parseTransferAction("copy"), TransferAction::Copy);
    ASSERT_EQ(parseTransferAction("MOVE"), TransferAction::Move);
    ASSERT_THROW(parseTransferAction("delete"), ConfigurationError);
}

TEST(TransferActionTest, NamesRoundTrip) {
    for (auto action : {TransferAction::Report, TransferAction::Copy, TransferAction::Move}) {
        ASSERT_EQ(parseTransferAction(toString(action)), action);
    }
}

// --- Transfer ---

class FileTransferTest : public BaseTestFixture {};

TEST_F(FileTransferTest, CopyPreservesLayoutAndSources) {
    std::vector<std::string> files = {sharp_png.string(), nested_png.string()};

    int count = FileTransfer::transfer(files, tempDir, outputDir, TransferAction::Copy);

    ASSERT_EQ(count, 2);
    ASSERT_TRUE(fs::exists(outputDir / "a_sharp.png"));
    ASSERT_TRUE(fs::exists(outputDir / "subdirectory" / "nested.png"));
    ASSERT_TRUE(fs::exists(sharp_png));
    ASSERT_TRUE(fs::exists(nested_png));
    ASSERT_EQ(fs::file_size(outputDir / "a_sharp.png"), fs::file_size(sharp_png));
}

TEST_F(FileTransferTest, MoveRemovesSources) {
    std::vector<std::string> files = {small_jpg.string(), nested_png.string()};

    int count = FileTransfer::transfer(files, tempDir, outputDir, TransferAction::Move);

    ASSERT_EQ(count, 2);
    ASSERT_TRUE(fs::exists(outputDir / "c_small.jpg"));
    ASSERT_TRUE(fs::exists(outputDir / "subdirectory" / "nested.png"));
    ASSERT_FALSE(fs::exists(small_jpg));
    ASSERT_FALSE(fs::exists(nested_png));
}

TEST_F(FileTransferTest, ReportActionTouchesNothing) {
    int count = FileTransfer::transfer({sharp_png.string()}, tempDir, outputDir, TransferAction::Report);

    ASSERT_EQ(count, 0);
    ASSERT_FALSE(fs::exists(outputDir));
    ASSERT_TRUE(fs::exists(sharp_png));
}

TEST_F(FileTransferTest, MissingSourceIsAnIOFailure) {
    std::vector<std::string> files = {(tempDir / "gone.jpg").string()};

    ASSERT_THROW(FileTransfer::transfer(files, tempDir, outputDir, TransferAction::Copy), IOFailure);
}

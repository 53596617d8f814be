#include "verifetch/download/file_destination.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace verifetch;
using download::FileDestination;
using download::FileDestinationOptions;
using download::OpenMode;

namespace {

FileDestinationOptions optionsIn(const std::filesystem::path& dir, const std::string& name,
                                 const std::string& extension) {
    FileDestinationOptions options;
    options.directory = dir;
    options.filename = name;
    options.extension = extension;
    return options;
}

}

TEST(FileDestination, RequiresFilename) {
    test::TempDirectory dir;
    EXPECT_THROW(FileDestination(optionsIn(dir.path(), "", "png")), std::invalid_argument);
}

TEST(FileDestination, BuildsPartAndFinalPaths) {
    test::TempDirectory dir;
    FileDestination destination(optionsIn(dir.path(), "image", "png"));

    EXPECT_EQ(destination.realPath(), dir.path() / "image.png");
    EXPECT_EQ(destination.tempPath(), dir.path() / "image.part");
    EXPECT_EQ(destination.path(), (dir.path() / "image.png").string());
    EXPECT_TRUE(destination.supportsPartial());

    destination.setExtension("jpg");
    EXPECT_EQ(destination.realPath(), dir.path() / "image.jpg");
    EXPECT_EQ(destination.tempPath(), dir.path() / "image.part");

    destination.setExtension("");
    EXPECT_EQ(destination.realPath(), dir.path() / "image");
}

TEST(FileDestination, PartDirectoryAndDisabledPartFiles) {
    test::TempDirectory dir;
    auto options = optionsIn(dir.path(), "image", "png");
    options.part_directory = dir.path() / "parts";
    FileDestination separate(options);
    EXPECT_EQ(separate.tempPath(), dir.path() / "parts" / "image.part");

    options.part = false;
    FileDestination direct(options);
    EXPECT_EQ(direct.tempPath(), direct.realPath());
    EXPECT_FALSE(direct.supportsPartial());
}

TEST(FileDestination, PartSize) {
    test::TempDirectory dir;
    FileDestination destination(optionsIn(dir.path(), "image", "png"));
    EXPECT_EQ(destination.partSize(), 0u);

    test::writeFile(dir.path() / "image.part", "12345");
    EXPECT_EQ(destination.partSize(), 5u);

    auto options = optionsIn(dir.path(), "other", "png");
    options.part = false;
    test::writeFile(dir.path() / "other.png", "12345");
    FileDestination direct(options);
    EXPECT_EQ(direct.partSize(), 0u);
}

TEST(FileDestination, ExistsNeedsAnExtension) {
    test::TempDirectory dir;
    test::writeFile(dir.path() / "image", "x");
    test::writeFile(dir.path() / "image.png", "x");

    FileDestination destination(optionsIn(dir.path(), "image", ""));
    EXPECT_FALSE(destination.exists());

    destination.setExtension("png");
    EXPECT_TRUE(destination.exists());

    destination.setExtension("gif");
    EXPECT_FALSE(destination.exists());
}

TEST(FileDestination, OpenCreatesDirectoriesAndTruncates) {
    test::TempDirectory dir;
    FileDestination destination(optionsIn(dir.path() / "a" / "b", "file", "txt"));

    {
        auto file = destination.open(OpenMode::TRUNCATE_CREATE);
        *file << "first version";
    }
    EXPECT_EQ(test::readFile(destination.tempPath()), "first version");

    {
        auto file = destination.open(OpenMode::UPDATE);
        file->seekp(6);
        *file << "VERSION";
    }
    EXPECT_EQ(test::readFile(destination.tempPath()), "first VERSION");

    {
        auto file = destination.open(OpenMode::TRUNCATE_CREATE);
        *file << "new";
    }
    EXPECT_EQ(test::readFile(destination.tempPath()), "new");
}

TEST(FileDestination, FinalizeMovesPartFileAndAppliesMtime) {
    test::TempDirectory dir;
    FileDestination destination(optionsIn(dir.path(), "image", "png"));
    test::writeFile(destination.tempPath(), "content");
    destination.setDesiredMtime(std::string("Wed, 21 Oct 2015 07:28:00 GMT"));

    destination.finalize();

    EXPECT_FALSE(std::filesystem::exists(destination.tempPath()));
    EXPECT_EQ(test::readFile(destination.realPath()), "content");

    struct stat info;
    ASSERT_EQ(::stat(destination.realPath().c_str(), &info), 0);
    EXPECT_EQ(info.st_mtime, 1445412480);
}

TEST(FileDestination, FinalizeSkipsPresentFiles) {
    test::TempDirectory dir;
    test::writeFile(dir.path() / "image.png", "old");
    FileDestination destination(optionsIn(dir.path(), "image", "png"));
    destination.markPresent();

    destination.finalize();
    EXPECT_TRUE(destination.isPresent());
    EXPECT_EQ(test::readFile(destination.realPath()), "old");
}

TEST(FileDestination, RemoveIncomplete) {
    test::TempDirectory dir;
    FileDestination destination(optionsIn(dir.path(), "image", "png"));
    test::writeFile(destination.tempPath(), "partial");

    destination.removeIncomplete();
    EXPECT_FALSE(std::filesystem::exists(destination.tempPath()));

    // Nothing to remove is not an error.
    destination.removeIncomplete();
}

TEST(FileDestination, HeaderFilenameReplacesUrlName) {
    test::TempDirectory dir;
    auto options = optionsIn(dir.path(), "download", "");
    options.use_header_filename = true;
    FileDestination destination(options);

    destination.setMetadata("http", {{"filename", "Report"}, {"extension", "pdf"}});
    destination.buildPath();
    EXPECT_EQ(destination.realPath(), dir.path() / "Report.pdf");
    EXPECT_EQ(destination.tempPath(), dir.path() / "download.part");

    auto plain_options = optionsIn(dir.path(), "download", "bin");
    FileDestination plain(plain_options);
    plain.setMetadata("http", {{"filename", "Report"}, {"extension", "pdf"}});
    plain.buildPath();
    EXPECT_EQ(plain.realPath(), dir.path() / "download.bin");
}

TEST(FilenameFromUrl, SplitsLastSegment) {
    using download::filenameFromUrl;
    EXPECT_EQ(filenameFromUrl("https://host/a/b.JPG?x=1"), std::make_pair(std::string("b"), std::string("jpg")));
    EXPECT_EQ(filenameFromUrl("https://host/a/archive.tar.gz"),
              std::make_pair(std::string("archive.tar"), std::string("gz")));
    EXPECT_EQ(filenameFromUrl("https://host/dir/"), std::make_pair(std::string(""), std::string("")));
    EXPECT_EQ(filenameFromUrl("https://host"), std::make_pair(std::string(""), std::string("")));
    EXPECT_EQ(filenameFromUrl("https://host/README#top"), std::make_pair(std::string("README"), std::string("")));
    EXPECT_EQ(filenameFromUrl("https://host/.hidden"), std::make_pair(std::string(".hidden"), std::string("")));
}

#include "verifetch/download/metadata.hpp"
#include <gtest/gtest.h>

using namespace verifetch;

TEST(Metadata, CopiesHeadersWithLowerCaseNames) {
    network::Response response;
    response.headers["Content-Type"] = "image/png";
    response.headers["ETag"] = "\"abc\"";

    auto data = download::extractMetadata(response);
    EXPECT_EQ(data.at("content-type"), "image/png");
    EXPECT_EQ(data.at("etag"), "\"abc\"");
    EXPECT_EQ(data.count("filename"), 0u);
    EXPECT_EQ(data.count("date"), 0u);
}

TEST(Metadata, FilenameFromContentDisposition) {
    network::Response response;
    response.headers["Content-Disposition"] = "attachment; filename=\"Holiday Photo.JPEG\"";

    auto data = download::extractMetadata(response);
    EXPECT_EQ(data.at("filename"), "Holiday Photo");
    EXPECT_EQ(data.at("extension"), "jpeg");
}

TEST(Metadata, FilenameWithoutExtensionOrWithPath) {
    network::Response plain;
    plain.headers["Content-Disposition"] = "inline; filename=\"README\"";
    auto data = download::extractMetadata(plain);
    EXPECT_EQ(data.at("filename"), "README");
    EXPECT_EQ(data.at("extension"), "");

    network::Response nested;
    nested.headers["Content-Disposition"] = "attachment; filename=\"dir/sub/file.tar.gz\"";
    data = download::extractMetadata(nested);
    EXPECT_EQ(data.at("filename"), "file.tar");
    EXPECT_EQ(data.at("extension"), "gz");
}

TEST(Metadata, UnquotedFilenameIsIgnored) {
    network::Response response;
    response.headers["Content-Disposition"] = "attachment; filename=file.png";
    auto data = download::extractMetadata(response);
    EXPECT_EQ(data.count("filename"), 0u);
}

TEST(Metadata, DateFromLastModified) {
    network::Response response;
    response.headers["Last-Modified"] = "Wed, 21 Oct 2015 07:28:00 GMT";
    auto data = download::extractMetadata(response);
    EXPECT_EQ(data.at("date"), "2015-10-21 07:28:00");
    EXPECT_EQ(data.at("last-modified"), "Wed, 21 Oct 2015 07:28:00 GMT");

    network::Response broken;
    broken.headers["Last-Modified"] = "sometime";
    EXPECT_EQ(download::extractMetadata(broken).count("date"), 0u);
}

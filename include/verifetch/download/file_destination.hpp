#pragma once

#include "destination.hpp"
#include <filesystem>

namespace verifetch {
namespace download {

struct FileDestinationOptions {
    std::filesystem::path directory = ".";
    std::string filename;
    std::string extension;
    bool part = true;
    std::filesystem::path part_directory;
    // Take filename and extension from Content-Disposition metadata when
    // the path is rebuilt.
    bool use_header_filename = false;
};

// Local file target. With partial files enabled the data goes to
// "<filename>.part" (fixed for the lifetime of the object, so a resumed
// transfer keeps writing the same file while the extension is corrected)
// and finalize() moves it to "<directory>/<filename>.<extension>".
class FileDestination : public Destination {
public:
    explicit FileDestination(FileDestinationOptions options);

    uint64_t partSize() const override;
    const std::string& extension() const override { return extension_; }
    void setExtension(const std::string& extension) override;
    bool exists() const override;
    std::unique_ptr<std::iostream> open(OpenMode mode) override;
    std::string path() const override { return real_path_.string(); }
    void setMetadata(const std::string& field, Metadata metadata) override;
    void buildPath() override;
    void markPresent() override { present_ = true; }
    bool supportsPartial() const override { return options_.part; }
    void removeIncomplete() override;
    const std::optional<std::string>& desiredMtime() const override { return mtime_; }
    void setDesiredMtime(std::optional<std::string> http_date) override { mtime_ = std::move(http_date); }

    // Moves the finished temp file into place and applies the desired mtime.
    // Does nothing for destinations marked present.
    void finalize();

    bool isPresent() const { return present_; }
    const std::string& filename() const { return filename_; }
    const std::filesystem::path& realPath() const { return real_path_; }
    const std::filesystem::path& tempPath() const { return temp_path_; }
    const std::map<std::string, Metadata>& metadata() const { return metadata_; }

private:
    FileDestinationOptions options_;
    std::string filename_;
    std::string extension_;
    std::filesystem::path real_path_;
    std::filesystem::path temp_path_;
    std::map<std::string, Metadata> metadata_;
    std::optional<std::string> mtime_;
    bool present_ = false;

    void applyMtime(const std::filesystem::path& path) const;
};

// Splits the last path segment of a URL into filename and extension;
// "https://host/a/b.JPG?x=1" -> {"b", "jpg"}.
std::pair<std::string, std::string> filenameFromUrl(const std::string& url);

}}

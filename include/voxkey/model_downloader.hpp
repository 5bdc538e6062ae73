#pragma once

#include <string>
#include <filesystem>

namespace voxkey {

class ModelDownloader {
public:
    virtual ~ModelDownloader() = default;

    // Fetch url into dest_dir/filename and return the written path.
    // Throws std::runtime_error on failure and leaves no partial file behind.
    virtual std::filesystem::path download(const std::string& url,
                                           const std::filesystem::path& dest_dir,
                                           const std::string& filename) = 0;
};

// libcurl implementation
class CurlModelDownloader : public ModelDownloader {
public:
    explicit CurlModelDownloader(long timeout_seconds = 600);

    std::filesystem::path download(const std::string& url,
                                   const std::filesystem::path& dest_dir,
                                   const std::string& filename) override;

private:
    long timeout_seconds_;
};

} // namespace voxkey

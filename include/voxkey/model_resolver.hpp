#pragma once

#include "voxkey/error.hpp"
#include "voxkey/model_downloader.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voxkey {

struct Config;

enum class CandidateSource {
    Explicit,
    OverrideRoot,
    UserCache,
    AppData,
    Download
};

const char* to_string(CandidateSource source);

struct ModelCandidate {
    std::filesystem::path file;
    CandidateSource source;
};

struct ResolveResult {
    bool success = false;
    std::filesystem::path model_file;
    CandidateSource source = CandidateSource::Explicit;
    ErrorCode error = ErrorCode::None;   // ModelNotFound, ModelLoadFailed or DownloadFailed
    std::string message;
};

struct ModelResolverOptions {
    std::string model_filename = "ggml-base.en.bin";
    std::string base_url;                       // model_filename is appended
    std::optional<std::filesystem::path> override_root;
    std::filesystem::path user_cache_dir;
    std::filesystem::path app_data_dir;         // downloads are persisted here
    std::filesystem::path download_dir;        // staging area for downloads
};

// Finds a loadable model, downloading it as a last resort.
class ModelResolver {
public:
    // Loads a model file; throws on failure
    using Loader = std::function<void(const std::filesystem::path&)>;

    ModelResolver(ModelResolverOptions options, std::unique_ptr<ModelDownloader> downloader);

    // XDG-based directories for the given config
    static ModelResolverOptions default_options(const Config& config);

    // Candidates in priority order. An explicit path is the only candidate
    // when given; a directory is joined with the model filename.
    std::vector<ModelCandidate> candidates(const std::optional<std::filesystem::path>& explicit_path) const;

    ResolveResult resolve(const std::optional<std::filesystem::path>& explicit_path, const Loader& load);

    const ModelResolverOptions& options() const { return options_; }

private:
    std::filesystem::path as_model_file(const std::filesystem::path& location) const;
    ResolveResult download_and_load(const Loader& load);
    void persist(const std::filesystem::path& downloaded) const;

    ModelResolverOptions options_;
    std::unique_ptr<ModelDownloader> downloader_;
};

} // namespace voxkey

#include "voxkey/model_resolver.hpp"
#include "voxkey/config.hpp"
#include <iostream>
#include <cstdlib>
#include <system_error>

namespace voxkey {

namespace {

std::filesystem::path xdg_dir(const char* env_name, const char* home_relative) {
    const char* xdg = std::getenv(env_name);
    if (xdg && *xdg) return std::filesystem::path(xdg) / "voxkey";
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
    return base / home_relative / "voxkey";
}

} // namespace

const char* to_string(CandidateSource source) {
    switch (source) {
        case CandidateSource::Explicit: return "explicit path";
        case CandidateSource::OverrideRoot: return "override root";
        case CandidateSource::UserCache: return "user cache";
        case CandidateSource::AppData: return "application data";
        case CandidateSource::Download: return "download";
    }
    return "unknown";
}

ModelResolver::ModelResolver(ModelResolverOptions options, std::unique_ptr<ModelDownloader> downloader)
    : options_(std::move(options))
    , downloader_(std::move(downloader)) {
}

ModelResolverOptions ModelResolver::default_options(const Config& config) {
    ModelResolverOptions options;
    options.model_filename = config.model_filename();
    options.base_url = config.model_base_url;
    if (!config.model_dir.empty()) {
        options.override_root = std::filesystem::path(config.model_dir);
    }
    auto cache = xdg_dir("XDG_CACHE_HOME", ".cache");
    options.user_cache_dir = cache / "models";
    options.download_dir = cache / "downloads";
    options.app_data_dir = xdg_dir("XDG_DATA_HOME", ".local/share") / "models";
    return options;
}

std::filesystem::path ModelResolver::as_model_file(const std::filesystem::path& location) const {
    std::error_code ec;
    if (std::filesystem::is_directory(location, ec)) {
        return location / options_.model_filename;
    }
    return location;
}

std::vector<ModelCandidate> ModelResolver::candidates(
        const std::optional<std::filesystem::path>& explicit_path) const {
    std::vector<ModelCandidate> out;
    if (explicit_path) {
        out.push_back({as_model_file(*explicit_path), CandidateSource::Explicit});
        return out;
    }
    if (options_.override_root) {
        out.push_back({*options_.override_root / options_.model_filename, CandidateSource::OverrideRoot});
    }
    out.push_back({options_.user_cache_dir / options_.model_filename, CandidateSource::UserCache});
    out.push_back({options_.app_data_dir / options_.model_filename, CandidateSource::AppData});
    return out;
}

ResolveResult ModelResolver::resolve(const std::optional<std::filesystem::path>& explicit_path,
                                     const Loader& load) {
    ResolveResult result;
    bool any_existed = false;

    for (const auto& candidate : candidates(explicit_path)) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate.file, ec)) {
            continue;
        }
        any_existed = true;

        try {
            load(candidate.file);
            result.success = true;
            result.model_file = candidate.file;
            result.source = candidate.source;
            std::cout << "Model resolved from " << to_string(candidate.source)
                      << ": " << candidate.file.string() << std::endl;
            return result;
        } catch (const std::exception& e) {
            std::cerr << "Model candidate " << candidate.file.string()
                      << " failed to load: " << e.what() << std::endl;
            result.message = e.what();
        }
    }

    if (explicit_path) {
        result.error = any_existed ? ErrorCode::ModelLoadFailed : ErrorCode::ModelNotFound;
        if (!any_existed) {
            result.message = "no model at " + explicit_path->string();
        }
        return result;
    }

    std::cout << "No local model found, falling back to download" << std::endl;
    return download_and_load(load);
}

ResolveResult ModelResolver::download_and_load(const Loader& load) {
    ResolveResult result;
    result.source = CandidateSource::Download;

    try {
        std::string url = options_.base_url;
        if (!url.empty() && url.back() != '/') url += '/';
        url += options_.model_filename;

        auto downloaded = downloader_->download(url, options_.download_dir, options_.model_filename);
        persist(downloaded);
        load(downloaded);

        result.success = true;
        result.model_file = downloaded;
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Model download failed: " << e.what() << std::endl;
        result.error = ErrorCode::DownloadFailed;
        result.message = e.what();
        return result;
    }
}

void ModelResolver::persist(const std::filesystem::path& downloaded) const {
    const auto target = options_.app_data_dir / options_.model_filename;
    std::error_code ec;
    if (std::filesystem::equivalent(downloaded, target, ec)) return;

    ec.clear();
    std::filesystem::create_directories(options_.app_data_dir, ec);
    if (!ec) {
        std::filesystem::copy_file(downloaded, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        std::cerr << "Could not cache model in " << options_.app_data_dir.string()
                  << ": " << ec.message() << std::endl;
        return;
    }
    std::cout << "Cached model at " << target.string() << std::endl;
}

} // namespace voxkey

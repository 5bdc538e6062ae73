#include "voxkey/model_downloader.hpp"
#include <iostream>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <curl/curl.h>

namespace voxkey {

namespace {

size_t write_to_file(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* file = static_cast<FILE*>(userp);
    return fwrite(contents, size, nmemb, file) * size;
}

int report_progress(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* last_percent = static_cast<int*>(clientp);
    if (dltotal <= 0) return 0;
    int percent = static_cast<int>((dlnow * 100) / dltotal);
    if (percent >= *last_percent + 10) {
        *last_percent = percent - percent % 10;
        std::cout << "  download " << *last_percent << "%" << std::endl;
    }
    return 0;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

CurlModelDownloader::CurlModelDownloader(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
}

std::filesystem::path CurlModelDownloader::download(const std::string& url,
                                                    const std::filesystem::path& dest_dir,
                                                    const std::string& filename) {
    ensure_curl_global_init();

    std::error_code ec;
    std::filesystem::create_directories(dest_dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dest_dir.string() + ": " + ec.message());
    }

    const std::filesystem::path final_path = dest_dir / filename;
    const std::filesystem::path part_path = dest_dir / (filename + ".part");

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("failed to initialize libcurl");
    }

    FILE* fp = fopen(part_path.string().c_str(), "wb");
    if (!fp) {
        curl_easy_cleanup(curl);
        throw std::runtime_error("cannot open " + part_path.string() + " for writing");
    }

    std::cout << "Downloading model: " << url << std::endl;

    int last_percent = 0;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, report_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &last_percent);

    CURLcode res = curl_easy_perform(curl);
    int close_result = fclose(fp);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK || close_result != 0) {
        std::filesystem::remove(part_path, ec);
        if (res != CURLE_OK) {
            throw std::runtime_error(std::string("download failed: ") + curl_easy_strerror(res));
        }
        throw std::runtime_error("failed to flush " + part_path.string());
    }

    std::filesystem::rename(part_path, final_path, ec);
    if (ec) {
        std::filesystem::remove(part_path, ec);
        throw std::runtime_error("cannot move download into place: " + final_path.string());
    }

    std::cout << "Downloaded model to " << final_path.string() << std::endl;
    return final_path;
}

} // namespace voxkey

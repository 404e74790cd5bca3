// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/tile_fetcher.h>
#include <dem_query/constants.h>
#include <dem_query/errors.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace dem_query {

ResponseClass ClassifyResponse(std::uint32_t status_code) noexcept {
    if (status_code == constants::http::STATUS_NOT_FOUND) {
        return ResponseClass::NOT_FOUND;
    }
    if (status_code >= constants::http::FIRST_ERROR_STATUS) {
        return ResponseClass::ERROR;
    }
    return ResponseClass::SUCCESS;
}

namespace {

/// libcurl write callback
size_t WriteCallback(void* contents, size_t size, size_t nmemb,
                     std::vector<std::uint8_t>* userp) {
    const size_t total_size = size * nmemb;
    userp->insert(userp->end(), static_cast<std::uint8_t*>(contents),
                  static_cast<std::uint8_t*>(contents) + total_size);
    return total_size;
}

/// curl_global_init is not thread-safe; run it once per process
/// @return Result of the one curl_global_init call
CURLcode EnsureCurlInitialized() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_OK;
    std::call_once(once, [] {
        init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (init_result != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(init_result));
        }
    });
    return init_result;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

/// libcurl tile fetcher, one easy handle per request
class CurlTileFetcher : public TileFetcher {
public:
    explicit CurlTileFetcher(const TileFetcherConfig& config)
        : config_(config), init_result_(EnsureCurlInitialized()) {}

    HttpResponse Fetch(const std::string& url) override {
        if (init_result_ != CURLE_OK) {
            throw TransportError(url, std::string("curl_global_init failed: ") +
                                      curl_easy_strerror(init_result_));
        }

        CurlHandle curl(curl_easy_init());
        if (!curl) {
            throw TransportError(url, "failed to initialize curl handle");
        }

        HttpResponse response;
        SetupCurlHandle(curl.get(), url, response.body);

        const auto start_time = std::chrono::steady_clock::now();
        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            spdlog::error("Curl error: {} for URL: {}", curl_easy_strerror(res), url);
            throw TransportError(url, curl_easy_strerror(res));
        }

        long response_code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
        response.status_code = static_cast<std::uint32_t>(response_code);

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        spdlog::debug("GET {} -> {} ({} bytes, {}ms)", url, response.status_code,
                      response.body.size(), elapsed.count());

        return response;
    }

private:
    void SetupCurlHandle(CURL* curl, const std::string& url,
                         std::vector<std::uint8_t>& data) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, constants::http::MAX_REDIRECTS);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.timeout_seconds));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // Prevent signals for thread safety

        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }
    }

    TileFetcherConfig config_;
    CURLcode init_result_;
};

} // anonymous namespace

std::unique_ptr<TileFetcher> TileFetcher::Create(const TileFetcherConfig& config) {
    return std::make_unique<CurlTileFetcher>(config);
}

} // namespace dem_query

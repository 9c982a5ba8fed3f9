#include "geo_overlay/io/http_client.hpp"
#include "geo_overlay/core/errors.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <regex>
#include <thread>

namespace geo_overlay::io {

namespace {

std::once_flag g_curl_init;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::vector<uint8_t>*>(userdata);
    size_t n = size * nmemb;
    out->insert(out->end(), reinterpret_cast<uint8_t*>(ptr), reinterpret_cast<uint8_t*>(ptr) + n);
    return n;
}

bool is_retryable_status(long status) {
    return status == 429 || status >= 500;
}

std::string body_excerpt(const std::vector<uint8_t>& body) {
    constexpr size_t kMax = 200;
    std::string s(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(std::min(body.size(), kMax)));
    for (auto& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

} // namespace

std::string redact_url(const std::string& url) {
    static const std::regex kSecretParam(
        R"(([?&](?:key|token|access_token|signature)=)[^&#]*)", std::regex::icase);
    return std::regex_replace(url, kSecretParam, "$1REDACTED");
}

CurlHttpClient::CurlHttpClient(const config::NetworkConfig& cfg)
    : cfg_(cfg) {
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::get(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw NetworkError("curl_easy_init failed");
    }

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg_.user_agent.c_str());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw NetworkError("GET " + redact_url(url) + " failed: " + msg);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    char* ct = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }
    curl_easy_cleanup(curl);
    return response;
}

std::vector<uint8_t> CurlHttpClient::fetch(const std::string& url) {
    const int attempts = cfg_.retries + 1;
    std::string last_error;
    long last_status = 0;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500 * (attempt - 1)));
        }

        try {
            HttpResponse r = get(url);
            if (r.status >= 200 && r.status < 300) {
                std::cerr << "[Http] GET " << redact_url(url).substr(0, 100) << " -> "
                          << r.status << " (" << r.body.size() << " bytes)" << std::endl;
                return std::move(r.body);
            }

            last_status = r.status;
            last_error = "HTTP " + std::to_string(r.status) + ": " + body_excerpt(r.body);
            if (!is_retryable_status(r.status)) break;
        } catch (const NetworkError& e) {
            last_status = 0;
            last_error = e.what();
        }

        std::cerr << "[Http] Attempt " << attempt << "/" << attempts << " failed: "
                  << last_error << std::endl;
    }

    throw NetworkError("GET " + redact_url(url) + " failed: " + last_error, last_status);
}

} // namespace geo_overlay::io

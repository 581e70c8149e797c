#include "lan_engine.hpp"
#include "response.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <curl/curl.h>
#include <format>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

namespace engine {

const char* upload_mime_type(const fs::path& file) {
    static constexpr std::array<std::pair<std::string_view, const char*>, 12> kTypes = {{
        {".wav", "audio/wav"},   {".mp3", "audio/mpeg"}, {".m4a", "audio/mp4"},
        {".mp4", "video/mp4"},   {".aac", "audio/aac"},  {".ogg", "audio/ogg"},
        {".flac", "audio/flac"}, {".wma", "audio/x-ms-wma"}, {".webm", "audio/webm"},
        {".mkv", "video/x-matroska"}, {".avi", "video/x-msvideo"}, {".mov", "video/quicktime"},
    }};
    auto ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto& [e, type] : kTypes) {
        if (e == ext) return type;
    }
    return nullptr;
}

} // namespace engine

LanEngine::LanEngine(std::string url, std::string api_format, uint32_t request_timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      request_timeout_s_(request_timeout_s) {}

LanEngine::~LanEngine() {
    close();
}

std::expected<void, Error> LanEngine::open() {
    if (open_) return {};
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        return std::unexpected(Error{ErrorKind::Engine,
            std::string("curl_global_init failed: ") + curl_easy_strerror(rc)});
    }
    open_ = true;
    return {};
}

void LanEngine::close() {
    if (!open_) return;
    curl_global_cleanup();
    open_ = false;
}

std::expected<EngineResult, Error>
LanEngine::transcribe(const fs::path& segment, const std::string& language) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Engine, std::move(msg)});
    };

    if (!open_) {
        return fail("engine not open");
    }
    std::error_code ec;
    if (!fs::is_regular_file(segment, ec)) {
        return fail("segment not found: " + segment.string());
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return fail("curl_easy_init failed");
    }

    // Build URL and form based on API format
    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, segment.c_str());
    curl_mime_filename(part, segment.filename().c_str());
    if (const char* type = engine::upload_mime_type(segment)) {
        curl_mime_type(part, type);
    }

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (!language.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request_timeout_s_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return fail(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_status >= 400) {
        return fail(std::format("HTTP {}: {}", http_status, engine::trim(response_body)));
    }

    auto parsed = engine::parse_server_response(response_body);
    if (!parsed) return std::unexpected(parsed.error());

    parsed->processing_s = processing_s;
    return parsed;
}

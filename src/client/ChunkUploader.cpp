#include "client/ChunkUploader.hpp"
#include "core/ByteUnits.hpp"

#include <boost/crc.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chunkdrop {
namespace client {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    std::string readSpan(const std::filesystem::path& file, const ChunkSpan& span) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open " + file.string());
        }
        std::string data(static_cast<std::size_t>(span.length), '\0');
        in.seekg(static_cast<std::streamoff>(span.offset));
        in.read(&data[0], static_cast<std::streamsize>(span.length));
        if (static_cast<std::uint64_t>(in.gcount()) != span.length) {
            throw std::runtime_error("Short read from " + file.string());
        }
        return data;
    }

    // 5xx and transport failures are worth another try, 4xx are not
    bool retryable(long status) {
        return status == 0 || status >= 500;
    }
}

std::vector<ChunkSpan> planChunks(std::uint64_t fileSize, std::uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    std::vector<ChunkSpan> spans;
    if (fileSize == 0) {
        spans.push_back(ChunkSpan{0, 0, 0});
        return spans;
    }

    std::uint64_t count = (fileSize + chunkSize - 1) / chunkSize;
    if (count > defaults::kMaxChunks) {
        throw std::invalid_argument("file needs " + std::to_string(count) + " chunks, more than " +
                                    std::to_string(defaults::kMaxChunks) + "; raise the chunk size");
    }

    for (std::uint64_t offset = 0, i = 0; offset < fileSize; offset += chunkSize, ++i) {
        std::uint64_t length = std::min(chunkSize, fileSize - offset);
        spans.push_back(ChunkSpan{static_cast<core::ChunkIndex>(i), offset, length});
    }
    return spans;
}

ChunkUploader::ChunkUploader(const std::string& baseUrl, std::uint64_t chunkSize, int retries, bool sendCrc)
    : baseUrl_(baseUrl), chunkSize_(chunkSize), retries_(retries), sendCrc_(sendCrc) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
    if (chunkSize_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (retries_ < 0) {
        throw std::invalid_argument("retries must not be negative");
    }
}

std::string ChunkUploader::escape(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string result = escaped ? escaped : "";
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

std::string ChunkUploader::chunkUrl(const std::string& filename, core::ChunkIndex index, core::ChunkIndex total,
                                    std::optional<std::uint32_t> crc) const {
    std::string url = baseUrl_ + "/upload_chunk?chunk=" + std::to_string(index) +
                      "&total=" + std::to_string(total) + "&filename=" + escape(filename);
    if (crc) {
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08x", *crc);
        url += "&crc32=";
        url += hex;
    }
    return url;
}

std::string ChunkUploader::finalizeUrl(const std::string& filename, core::ChunkIndex total) const {
    return baseUrl_ + "/finalize_upload?filename=" + escape(filename) + "&total=" + std::to_string(total);
}

std::string ChunkUploader::statusUrl(const std::string& filename, core::ChunkIndex total) const {
    return baseUrl_ + "/upload_status?filename=" + escape(filename) + "&total=" + std::to_string(total);
}

std::vector<core::ChunkIndex> ChunkUploader::parseMissing(const std::string& statusJson) {
    nlohmann::json status = nlohmann::json::parse(statusJson);
    if (!status.is_object() || !status.contains("missing") || !status["missing"].is_array()) {
        throw std::runtime_error("upload status reply has no 'missing' list");
    }
    return status["missing"].get<std::vector<core::ChunkIndex>>();
}

HttpReply ChunkUploader::httpPost(const std::string& url, const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HttpReply reply;
    struct curl_slist* headerList = nullptr;
    headerList = curl_slist_append(headerList, "Content-Type: application/octet-stream");
    headerList = curl_slist_append(headerList, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 600L);  // a 90 MiB chunk over a slow link

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "CURL error: " << curl_easy_strerror(res) << std::endl;
        reply.status = 0;
        reply.body = curl_easy_strerror(res);
    }
    return reply;
}

HttpReply ChunkUploader::httpGet(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HttpReply reply;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL error: ") + curl_easy_strerror(res));
    }
    return reply;
}

int ChunkUploader::sendChunk(const std::filesystem::path& file, const std::string& filename,
                             const ChunkSpan& span, core::ChunkIndex total) {
    std::string data = readSpan(file, span);

    std::optional<std::uint32_t> crc;
    if (sendCrc_) {
        boost::crc_32_type digest;
        digest.process_bytes(data.data(), data.size());
        crc = digest.checksum();
    }
    const std::string url = chunkUrl(filename, span.index, total, crc);

    for (int attempt = 0; ; ++attempt) {
        HttpReply reply = httpPost(url, data);
        if (reply.status == 200) {
            std::cout << "Uploaded chunk " << span.index + 1 << "/" << total << " of " << filename
                      << " (" << core::formatBytes(span.length) << ")" << std::endl;
            return attempt;
        }

        std::cerr << "Chunk " << span.index + 1 << "/" << total << " failed";
        if (reply.status != 0) std::cerr << " with HTTP " << reply.status;
        std::cerr << ": " << reply.body << std::endl;

        if (!retryable(reply.status) || attempt >= retries_) {
            throw std::runtime_error("chunk " + std::to_string(span.index) + " of " + filename +
                                     " failed: " + reply.body);
        }
    }
}

UploadReport ChunkUploader::upload(const std::filesystem::path& file) {
    UploadReport report;
    report.filename = file.filename().string();
    report.bytes = std::filesystem::file_size(file);

    std::vector<ChunkSpan> spans = planChunks(report.bytes, chunkSize_);
    report.chunks = static_cast<core::ChunkIndex>(spans.size());

    for (const ChunkSpan& span : spans) {
        report.retries += sendChunk(file, report.filename, span, report.chunks);
    }

    HttpReply reply = httpPost(finalizeUrl(report.filename, report.chunks), "");
    if (reply.status == 409) {
        std::cerr << "Finalize of " << report.filename << " reported missing chunks, resending" << std::endl;

        HttpReply status = httpGet(statusUrl(report.filename, report.chunks));
        if (status.status != 200) {
            throw std::runtime_error("upload status of " + report.filename + " failed: " + status.body);
        }
        for (core::ChunkIndex index : parseMissing(status.body)) {
            if (index >= spans.size()) {
                throw std::runtime_error("server reported an unknown chunk index " + std::to_string(index));
            }
            report.retries += 1 + sendChunk(file, report.filename, spans[index], report.chunks);
        }
        reply = httpPost(finalizeUrl(report.filename, report.chunks), "");
    }

    if (reply.status != 200) {
        throw std::runtime_error("finalize of " + report.filename + " failed with HTTP " +
                                 std::to_string(reply.status) + ": " + reply.body);
    }

    try {
        report.message = nlohmann::json::parse(reply.body).value("message", std::string());
    } catch (const nlohmann::json::parse_error&) {
        report.message = reply.body;
    }
    return report;
}

} // namespace client
} // namespace chunkdrop

#include "collector/http_ingest_client.hpp"
#include "ingest/wire_codec.hpp"
#include "util/errors.hpp"

#include <curl/curl.h>
#include <memory>

// Helper for CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append((char*)contents, new_length);
    return new_length;
}

HttpIngestClient::HttpIngestClient(std::string base_url, std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();
    if (base_url.empty()) throw ConfigError("ingest base url is empty");
    url_ = base_url + "/internal/ingest";
}

IngestResult HttpIngestClient::deliver(const IngestBatch& batch) {
    const std::string body = encode_batch(batch);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw DeliveryError("curl_easy_init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "User-Agent: pricefuse-collector/1.0");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    std::string response_str;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_str);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw DeliveryError(std::string("POST ") + url_ + ": " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200 && http_code != 400) {
        throw DeliveryError("POST " + url_ + " returned HTTP " + std::to_string(http_code));
    }

    try {
        return decode_result(response_str);
    } catch (const WireFormatError& e) {
        throw DeliveryError("POST " + url_ + " HTTP " + std::to_string(http_code) + ": " + e.what());
    }
}

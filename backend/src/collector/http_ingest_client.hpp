#pragma once
#include <chrono>
#include <string>

#include "collector/ingest_client.hpp"

// POSTs batches to {base_url}/internal/ingest with libcurl.
// 200 and 400 responses carrying an ingest result are acknowledgements;
// anything else (curl failure, 5xx, unparseable body) is a DeliveryError.
class HttpIngestClient : public IIngestClient {
public:
    HttpIngestClient(std::string base_url, std::chrono::milliseconds timeout);

    IngestResult deliver(const IngestBatch &batch) override;

    const std::string &url() const { return url_; }

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
};

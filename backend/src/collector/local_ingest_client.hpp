#pragma once
#include <memory>

#include "collector/ingest_client.hpp"
#include "ingest/ingestion_gateway.hpp"

// In-process delivery straight into a gateway, for single-binary runs and tests.
class LocalIngestClient : public IIngestClient {
public:
    explicit LocalIngestClient(std::shared_ptr<IngestionGateway> gateway)
        : gateway_(std::move(gateway)) {}

    IngestResult deliver(const IngestBatch &batch) override {
        return gateway_->ingest(batch);
    }

private:
    std::shared_ptr<IngestionGateway> gateway_;
};

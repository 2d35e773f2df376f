#pragma once
#include "md/price_feed.hpp"

// Delivery side of the ingestion boundary.
// A returned IngestResult (any status) means the gateway processed the batch.
// Transport failures and unusable responses throw DeliveryError.
class IIngestClient {
public:
    virtual ~IIngestClient() = default;
    virtual IngestResult deliver(const IngestBatch &batch) = 0;
};

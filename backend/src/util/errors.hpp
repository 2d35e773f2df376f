#pragma once
#include <stdexcept>
#include <string>

// Error taxonomy shared by collector and gateway.

// WebSocket open/write/read failure. Drives reconnect scheduling.
struct TransportError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A price-shaped exchange message that could not be decoded.
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One feed or batch the gateway will not accept. Caught per item and
// reported in IngestResult; it never escapes ingest().
struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Forwarder could not hand a batch to the ingestion boundary.
struct DeliveryError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed configuration detected at startup. Fatal.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Durable store read/write failure.
struct StorageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Request body that is not valid JSON or misses required batch fields.
struct WireFormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

#pragma once
#include <memory>
#include <string>

#include "venues/exchange_adapter.hpp"

// Blocking text-frame WebSocket connection.
// open/write/read run on the owning connection's threads; close() may be
// called from any thread and unblocks a pending read().
class IWsTransport
{
public:
    virtual ~IWsTransport() = default;

    // Throws TransportError on resolve/connect/TLS/handshake failure.
    virtual void open(const WsEndpoint &ep) = 0;
    // Throws TransportError.
    virtual void write(const std::string &text) = 0;
    // Next text frame into `out`. False on orderly close; TransportError otherwise.
    virtual bool read(std::string &out) = 0;
    virtual void close() noexcept = 0;
};

// NOTE: Beast implementation lives behind a pointer to implementation (PIMPL) to keep Boost headers out of dependents

class BeastWsTransport : public IWsTransport
{
public:
    explicit BeastWsTransport(std::string user_agent = "pricefuse-collector/1.0");
    ~BeastWsTransport() override;
    BeastWsTransport(const BeastWsTransport &) = delete;
    BeastWsTransport &operator=(const BeastWsTransport &) = delete;

    void open(const WsEndpoint &ep) override;
    void write(const std::string &text) override;
    bool read(std::string &out) override;
    void close() noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

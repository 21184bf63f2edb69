#pragma once
#include "types.hpp"
#include <memory>
#include <string>

// Writes every terminal trade outcome to trade_audit_log in PostgreSQL
class TradeAuditStore {
public:
    explicit TradeAuditStore(const std::string& conn_string);
    ~TradeAuditStore();

    bool is_connected() const;

    // Creates trade_audit_log when missing
    void ensure_schema();

    bool record(const TradeRequest& request, const TradeResult& result);

    // Non-copyable
    TradeAuditStore(const TradeAuditStore&) = delete;
    TradeAuditStore& operator=(const TradeAuditStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

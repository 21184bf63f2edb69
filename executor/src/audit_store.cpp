#include "audit_store.hpp"
#include "backoff_manager.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <mutex>

class TradeAuditStore::Impl {
public:
    explicit Impl(const std::string& conn_string)
        : conn_string_(conn_string),
          backoff_(std::chrono::milliseconds(1000), std::chrono::milliseconds(30000), 2.0, 0.0) {
        open_connection();
    }

    ~Impl() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
        }
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    // Reconnects at most once per backoff window
    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }
        if (backoff_.should_wait(kBackoffKey)) {
            return false;
        }
        if (open_connection()) {
            spdlog::info("PostgreSQL audit connection restored");
            return true;
        }
        return false;
    }

    void ensure_schema() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            throw std::runtime_error("audit database unavailable");
        }

        pqxx::work txn(*conn_);
        txn.exec(
            "CREATE TABLE IF NOT EXISTS trade_audit_log ("
            "  id BIGSERIAL PRIMARY KEY,"
            "  request_id TEXT NOT NULL,"
            "  wallet TEXT NOT NULL,"
            "  input_mint TEXT NOT NULL,"
            "  output_mint TEXT NOT NULL,"
            "  amount DOUBLE PRECISION NOT NULL,"
            "  max_slippage_pct DOUBLE PRECISION NOT NULL,"
            "  status TEXT NOT NULL,"
            "  tx_signature TEXT,"
            "  actual_output_amount DOUBLE PRECISION,"
            "  fee_paid DOUBLE PRECISION,"
            "  rejection_reason TEXT,"
            "  attempts INTEGER NOT NULL,"
            "  completed_at TIMESTAMPTZ NOT NULL"
            ")");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_trade_audit_request ON trade_audit_log (request_id)");
        txn.commit();
        spdlog::info("Audit schema ready");
    }

    bool record(const TradeRequest& request, const TradeResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            spdlog::warn("Audit database unavailable, trade {} not recorded", result.request_id);
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec_params(
                "INSERT INTO trade_audit_log (request_id, wallet, input_mint, output_mint, amount, "
                "max_slippage_pct, status, tx_signature, actual_output_amount, fee_paid, "
                "rejection_reason, attempts, completed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13::timestamptz)",
                result.request_id,
                request.requester_wallet,
                request.input_token,
                request.output_token,
                request.amount,
                request.max_slippage_pct,
                std::string(to_string(result.status)),
                result.tx_signature,
                result.actual_output_amount,
                result.fee_paid,
                result.rejection_reason,
                result.attempts,
                util::format_timestamp(result.completed_at)
            );
            txn.commit();
            return true;
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("Audit database connection lost: {}", e.what());
            conn_.reset();
            backoff_.record_failure(kBackoffKey);
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to record trade {}: {}", result.request_id, e.what());
            return false;
        }
    }

private:
    static constexpr const char* kBackoffKey = "postgres";

    bool open_connection() {
        try {
            conn_ = std::make_unique<pqxx::connection>(conn_string_);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL audit database");
                backoff_.record_success(kBackoffKey);
                return true;
            }
            spdlog::error("PostgreSQL audit connection is not open");
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
        }
        conn_.reset();
        backoff_.record_failure(kBackoffKey);
        return false;
    }

    std::string conn_string_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex mutex_;
    BackoffManager backoff_;
};

TradeAuditStore::TradeAuditStore(const std::string& conn_string)
    : pImpl_(std::make_unique<Impl>(conn_string)) {}

TradeAuditStore::~TradeAuditStore() = default;

bool TradeAuditStore::is_connected() const {
    return pImpl_->is_connected();
}

void TradeAuditStore::ensure_schema() {
    pImpl_->ensure_schema();
}

bool TradeAuditStore::record(const TradeRequest& request, const TradeResult& result) {
    return pImpl_->record(request, result);
}

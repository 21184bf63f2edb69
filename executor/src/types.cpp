#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

double ConsensusPrice::price_for(const std::string& input_mint, const std::string& output_mint) const {
    if (token_pair.base_mint == input_mint && token_pair.quote_mint == output_mint) {
        return price;
    }
    if (token_pair.base_mint == output_mint && token_pair.quote_mint == input_mint && price > 0.0) {
        return 1.0 / price;
    }
    throw std::invalid_argument("Consensus price " + token_pair.to_string() +
                                " does not cover " + input_mint + "/" + output_mint);
}

std::optional<TradeRequest> TradeRequest::from_json(const nlohmann::json& j) {
    try {
        TradeRequest request;
        request.request_id = j.value("request_id", "");
        request.requester_wallet = j.at("wallet").get<std::string>();
        request.input_token = j.at("input_mint").get<std::string>();
        request.output_token = j.at("output_mint").get<std::string>();
        request.amount = j.at("amount").get<double>();
        request.max_slippage_pct = j.value("max_slippage_pct", 1.0);
        request.min_profit_threshold = j.value("min_profit", 0.0);
        request.timeout_ms = j.value("timeout_ms", static_cast<int64_t>(0));

        if (request.request_id.empty()) {
            request.request_id = util::generate_uuid();
        }
        if (request.amount <= 0.0) {
            spdlog::warn("Trade request {} has non-positive amount", request.request_id);
            return std::nullopt;
        }
        if (request.input_token == request.output_token) {
            spdlog::warn("Trade request {} swaps a token for itself", request.request_id);
            return std::nullopt;
        }
        return request;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse trade request: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json TradeRequest::to_json() const {
    return {
        {"request_id", request_id},
        {"wallet", requester_wallet},
        {"input_mint", input_token},
        {"output_mint", output_token},
        {"amount", amount},
        {"max_slippage_pct", max_slippage_pct},
        {"min_profit", min_profit_threshold},
        {"timeout_ms", timeout_ms}
    };
}

nlohmann::json TradeResult::to_json() const {
    nlohmann::json j = {
        {"request_id", request_id},
        {"status", to_string(status)},
        {"attempts", attempts},
        {"ts", util::format_timestamp(completed_at)}
    };

    // Optional fields are emitted as null so consumers see a fixed shape
    j["tx_signature"] = tx_signature ? nlohmann::json(*tx_signature) : nlohmann::json(nullptr);
    j["actual_output_amount"] = actual_output_amount ? nlohmann::json(*actual_output_amount) : nlohmann::json(nullptr);
    j["fee_paid"] = fee_paid ? nlohmann::json(*fee_paid) : nlohmann::json(nullptr);
    j["rejection_reason"] = rejection_reason ? nlohmann::json(*rejection_reason) : nlohmann::json(nullptr);
    return j;
}

const char* to_string(PriceConfidence confidence) {
    switch (confidence) {
        case PriceConfidence::High: return "high";
        case PriceConfidence::Medium: return "medium";
        case PriceConfidence::Low: return "low";
    }
    return "unknown";
}

const char* to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::Executed: return "executed";
        case TradeStatus::Rejected: return "rejected";
        case TradeStatus::Failed: return "failed";
    }
    return "unknown";
}

nlohmann::json to_json(const ConsensusPrice& price) {
    nlohmann::json sources = nlohmann::json::array();
    for (const auto& quote : price.quotes) {
        sources.push_back({
            {"source", quote.source_id},
            {"price", quote.price},
            {"observed_at", util::to_unix_millis(quote.observed_at)},
            {"latency_ms", quote.latency_ms}
        });
    }

    return {
        {"pair", price.token_pair.to_string()},
        {"price", price.price},
        {"max_deviation_pct", price.max_deviation_pct},
        {"confidence", to_string(price.confidence)},
        {"computed_at", util::to_unix_millis(price.computed_at)},
        {"sources", sources}
    };
}

nlohmann::json to_json(const SwapQuote& quote) {
    return {
        {"request_id", quote.request_id},
        {"input_mint", quote.input_token},
        {"output_mint", quote.output_token},
        {"input_amount", quote.input_amount},
        {"expected_output_amount", quote.expected_output_amount},
        {"estimated_fee", quote.estimated_fee},
        {"estimated_slippage_pct", quote.estimated_slippage_pct},
        {"route_hops", quote.route_hops},
        {"provider", quote.provider},
        {"built_at", util::to_unix_millis(quote.built_at)},
        {"expires_at", util::to_unix_millis(quote.expires_at)}
    };
}

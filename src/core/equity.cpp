/**
 * @file equity.cpp
 * @brief Implementation of Equity, MarketParameters and portfolio checks
 */

#include "core/equity.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <utility>

namespace capm
{

    namespace
    {
        void require_finite(double value, const char *field, const std::string &ticker)
        {
            if (!std::isfinite(value))
            {
                throw ValidationError(
                    std::string("Equity '") + ticker + "' has non-finite " + field);
            }
        }
    }

    // ============================================================================
    // Equity Implementation
    // ============================================================================

    Equity::Equity(double beta,
                   double qty,
                   double avg_price,
                   std::optional<double> expected_return,
                   std::string ticker)
        : ticker_(std::move(ticker)),
          beta_(beta),
          qty_(qty),
          avg_price_(avg_price),
          expected_return_(expected_return)
    {
        require_finite(beta_, "beta", ticker_);
        require_finite(qty_, "qty", ticker_);
        require_finite(avg_price_, "avg_price", ticker_);
        if (expected_return_)
        {
            require_finite(*expected_return_, "return", ticker_);
        }

        if (qty_ < 0.0)
        {
            throw ValidationError(
                "Equity '" + ticker_ + "' has negative qty: " + std::to_string(qty_));
        }

        if (avg_price_ < 0.0)
        {
            throw ValidationError(
                "Equity '" + ticker_ + "' has negative avg_price: " + std::to_string(avg_price_));
        }
    }

    double Equity::market_value() const
    {
        return qty_ * avg_price_;
    }

    Equity Equity::with_quantity(double qty) const
    {
        return Equity(beta_, qty, avg_price_, expected_return_, ticker_);
    }

    std::string Equity::label(size_t index) const
    {
        if (!ticker_.empty())
        {
            return ticker_;
        }
        return "#" + std::to_string(index);
    }

    nlohmann::json Equity::to_json() const
    {
        nlohmann::json j{
            {"ticker", ticker_},
            {"beta", beta_},
            {"qty", qty_},
            {"avg_price", avg_price_}};

        if (expected_return_)
        {
            j["return"] = *expected_return_;
        }
        return j;
    }

    Equity Equity::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw ValidationError("Equity entry must be a JSON object");
        }

        for (const char *field : {"beta", "qty", "avg_price"})
        {
            if (!j.contains(field) || !j[field].is_number())
            {
                throw ValidationError(
                    std::string("Equity entry is missing numeric field '") + field + "'");
            }
        }

        std::optional<double> expected_return;
        if (j.contains("return") && !j["return"].is_null())
        {
            if (!j["return"].is_number())
            {
                throw ValidationError("Equity field 'return' must be numeric");
            }
            expected_return = j["return"].get<double>();
        }

        std::string ticker;
        if (j.contains("ticker") && !j["ticker"].is_null())
        {
            if (!j["ticker"].is_string())
            {
                throw ValidationError("Equity field 'ticker' must be a string");
            }
            ticker = j["ticker"].get<std::string>();
        }

        return Equity(j["beta"].get<double>(),
                      j["qty"].get<double>(),
                      j["avg_price"].get<double>(),
                      expected_return,
                      ticker);
    }

    // ============================================================================
    // MarketParameters Implementation
    // ============================================================================

    nlohmann::json MarketParameters::to_json() const
    {
        return nlohmann::json{
            {"benchmark_return", benchmark_return},
            {"risk_free_rate", risk_free_rate}};
    }

    MarketParameters MarketParameters::from_json(const nlohmann::json &j)
    {
        MarketParameters params;
        params.benchmark_return = j.value("benchmark_return", 0.07);
        params.risk_free_rate = j.value("risk_free_rate", 0.02);

        if (!std::isfinite(params.benchmark_return) || !std::isfinite(params.risk_free_rate))
        {
            throw ValidationError("Market parameters must be finite");
        }
        return params;
    }

    // ============================================================================
    // Portfolio helpers
    // ============================================================================

    void validate_portfolio(const Portfolio &equities, bool require_expected_return)
    {
        if (equities.empty())
        {
            throw ValidationError("Portfolio is empty");
        }

        if (!require_expected_return)
        {
            return;
        }

        for (size_t i = 0; i < equities.size(); ++i)
        {
            if (!equities[i].has_expected_return())
            {
                throw ValidationError(
                    "Equity " + equities[i].label(i) + " has no return");
            }
        }
    }

    double total_market_value(const Portfolio &equities)
    {
        double total = 0.0;
        for (const auto &equity : equities)
        {
            total += equity.market_value();
        }
        return total;
    }

} // namespace capm

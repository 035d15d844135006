/**
 * @file equity.hpp
 * @brief Portfolio position value types
 *
 * An Equity is an immutable record of one holding. The optimizer never
 * edits a record in place; it produces new records through with_quantity().
 */

#ifndef CAPM_CORE_EQUITY_HPP
#define CAPM_CORE_EQUITY_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace capm
{

    /**
     * @class Equity
     * @brief One portfolio position
     *
     * Fields:
     * - beta: sensitivity to the benchmark
     * - qty: units held (>= 0)
     * - avg_price: cost basis per unit, also the market value proxy (>= 0)
     * - expected_return: realized or expected return (optional)
     *
     * Usage Example:
     * @code
     * Equity a(1.2, 100, 50.0, 0.08, "AAA");
     * Equity b = a.with_quantity(120);
     * @endcode
     */
    class Equity
    {
    public:
        /**
         * @brief Construct a position
         * @param beta Benchmark sensitivity
         * @param qty Units held
         * @param avg_price Cost basis per unit
         * @param expected_return Return used by the Sharpe objective and metrics
         * @param ticker Display label (may be empty)
         * @throws ValidationError if qty or avg_price is negative, or any
         *         numeric field is NaN/Inf
         */
        Equity(double beta,
               double qty,
               double avg_price,
               std::optional<double> expected_return = std::nullopt,
               std::string ticker = "");

        const std::string &ticker() const { return ticker_; }
        double beta() const { return beta_; }
        double qty() const { return qty_; }
        double avg_price() const { return avg_price_; }
        const std::optional<double> &expected_return() const { return expected_return_; }
        bool has_expected_return() const { return expected_return_.has_value(); }

        /**
         * @brief qty * avg_price
         */
        double market_value() const;

        /**
         * @brief Copy of this record holding a different quantity
         * @throws ValidationError if qty is negative or not finite
         */
        Equity with_quantity(double qty) const;

        /**
         * @brief Display name, falls back to the position index
         */
        std::string label(size_t index) const;

        nlohmann::json to_json() const;

        /**
         * @brief Parse {"ticker", "beta", "qty", "avg_price", "return"}
         * @throws ValidationError if a required field is missing or invalid
         */
        static Equity from_json(const nlohmann::json &j);

    private:
        std::string ticker_;
        double beta_;
        double qty_;
        double avg_price_;
        std::optional<double> expected_return_;
    };

    using Portfolio = std::vector<Equity>;

    /**
     * @struct MarketParameters
     * @brief Scalars shared by every equity in one computation
     */
    struct MarketParameters
    {
        double benchmark_return = 0.07; ///< Broad index return
        double risk_free_rate = 0.02;   ///< Short-term treasury rate

        /**
         * @brief benchmark_return - risk_free_rate
         */
        double market_excess_return() const { return benchmark_return - risk_free_rate; }

        nlohmann::json to_json() const;
        static MarketParameters from_json(const nlohmann::json &j);
    };

    /**
     * @brief Check that a portfolio can be fed to the optimizer or metrics
     * @param equities Positions to check
     * @param require_expected_return Every position must carry a return
     * @throws ValidationError if empty or a required return is missing
     */
    void validate_portfolio(const Portfolio &equities, bool require_expected_return);

    /**
     * @brief Sum of avg_price * qty over all positions
     */
    double total_market_value(const Portfolio &equities);

} // namespace capm

#endif // CAPM_CORE_EQUITY_HPP

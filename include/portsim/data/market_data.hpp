/*
 * @file market_data.hpp
 * @brief Time-series market data storage and the read-only feed interface.
 *
 * Prices are stored as Eigen matrices (dates x assets) with associated date
 * and ticker indices. The simulation engine only sees the MarketDataFeed
 * interface; MarketData is the in-memory implementation.
 */

#ifndef PORTSIM_DATA_MARKET_DATA_HPP
#define PORTSIM_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>

namespace portsim
{

    /**
     *  @enum ReturnType
     *  @brief Type of return calculation.
     */
    enum class ReturnType
    {
        SIMPLE, /**< Simple returns (P_t / P_{t-1} - 1) */
        LOG     /**< Logarithmic returns (log(P_t / P_{t-1})) */
    };

    /**
     * @struct PriceBar
     * @brief One OHLCV observation.
     */
    struct PriceBar
    {
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
    };

    /**
     * @class MarketDataFeed
     * @brief Read-only view of pre-loaded market data.
     *
     * Missing observations are NaN in close_prices(). Dates are ISO strings
     * sorted ascending.
     */
    class MarketDataFeed
    {
    public:
        virtual ~MarketDataFeed() = default;

        virtual const std::vector<std::string> &get_dates() const = 0;
        virtual const std::vector<std::string> &get_tickers() const = 0;

        /**
         * @brief Close price matrix (dates x assets), NaN where missing.
         */
        virtual const Eigen::MatrixXd &close_prices() const = 0;

        /**
         * @brief Full bar for one date/asset, empty if the close is missing.
         */
        virtual std::optional<PriceBar> get_bar(size_t date_idx, size_t asset_idx) const = 0;
    };

    /**
     * @class MarketData
     * @brief Container for multi-asset time-series price data.
     *
     * @note All data is stored as (time x assets).
     * @note Missing data is represented as NaN values.
     */
    class MarketData : public MarketDataFeed
    {
    public:
        /**
         * @brief Constructor with close prices only.
         * @param prices Close price matrix (dates x assets).
         * @param dates Vector of date strings, ascending.
         * @param tickers Vector of asset ticker symbols.
         * @throws std::invalid_argument on dimension mismatch or unsorted dates
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~MarketData() override = default;

        // ===========================================
        //  Feed interface
        // ===========================================

        const std::vector<std::string> &get_dates() const override { return dates_; }
        const std::vector<std::string> &get_tickers() const override { return tickers_; }
        const Eigen::MatrixXd &close_prices() const override { return prices_; }
        std::optional<PriceBar> get_bar(size_t date_idx, size_t asset_idx) const override;

        // ===========================================
        //  Data Access Methods
        // ===========================================

        /**
         * @brief Get prices for a specific asset.
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        /**
         * @brief Get price for specific asset and date.
         */
        double get_price(const std::string &ticker, const std::string &date) const;

        size_t num_dates() const { return static_cast<size_t>(prices_.rows()); }
        size_t num_assets() const { return static_cast<size_t>(prices_.cols()); }
        bool has_bars() const { return open_.size() > 0; }

        /**
         * @brief Attach open/high/low/volume matrices matching the close matrix.
         * @throws std::invalid_argument if dimensions don't match
         */
        void set_bars(const Eigen::MatrixXd &open,
                      const Eigen::MatrixXd &high,
                      const Eigen::MatrixXd &low,
                      const Eigen::MatrixXd &volume);

        /**
         * @brief Set price for specific asset and date
         */
        void set_price(const std::string &ticker, const std::string &date, double price);

        // ===========================================
        //  Calculation / Filtering
        // ===========================================

        /**
         * @brief Calculate returns from prices
         * @param type Type of return calculation (SIMPLE or LOG)
         * @return Matrix of returns (dates-1 x assets), NaN where either price is missing
         */
        Eigen::MatrixXd calculate_returns(ReturnType type = ReturnType::SIMPLE) const;

        /**
         * @brief Filter data by date range (both inclusive, need not be present)
         * @throws std::invalid_argument if no date falls in the range
         */
        MarketData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /**
         * @brief Forward-fill missing data; leading gaps stay NaN
         */
        MarketData forward_fill() const;

        /**
         * @brief Index of an exact date, -1 if absent
         */
        int find_date_index(const std::string &date) const;

        /**
         * @brief Index of an asset, -1 if absent
         */
        int find_ticker_index(const std::string &ticker) const;

        bool is_valid() const;
        size_t count_missing() const;
        void print_summary() const;

    private:
        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Close prices (dates x assets)
        Eigen::MatrixXd open_;                       ///< Empty unless set_bars was called
        Eigen::MatrixXd high_;
        Eigen::MatrixXd low_;
        Eigen::MatrixXd volume_;
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> date_index_;   ///< Date to index map
        std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
    };

} // namespace portsim

#endif // PORTSIM_DATA_MARKET_DATA_HPP

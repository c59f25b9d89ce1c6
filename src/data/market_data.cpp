/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "portsim/data/market_data.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>

namespace portsim
{

    // ============================================================================
    // Constructors
    // ============================================================================

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }
        if (!std::is_sorted(dates_.begin(), dates_.end()))
        {
            throw std::invalid_argument("Dates must be sorted ascending");
        }

        build_index_maps();

        if (date_index_.size() != dates_.size())
        {
            throw std::invalid_argument("Dates must be unique");
        }
        if (ticker_index_.size() != tickers_.size())
        {
            throw std::invalid_argument("Tickers must be unique");
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    std::optional<PriceBar> MarketData::get_bar(size_t date_idx, size_t asset_idx) const
    {
        if (date_idx >= num_dates() || asset_idx >= num_assets())
        {
            throw std::out_of_range("Bar index out of range");
        }

        const auto r = static_cast<Eigen::Index>(date_idx);
        const auto c = static_cast<Eigen::Index>(asset_idx);
        double close = prices_(r, c);
        if (std::isnan(close))
        {
            return std::nullopt;
        }

        PriceBar bar;
        bar.close = close;
        if (has_bars())
        {
            bar.open = open_(r, c);
            bar.high = high_(r, c);
            bar.low = low_(r, c);
            bar.volume = volume_(r, c);
        }
        else
        {
            bar.open = close;
            bar.high = close;
            bar.low = close;
            bar.volume = std::numeric_limits<double>::quiet_NaN();
        }
        return bar;
    }

    Eigen::VectorXd MarketData::get_prices(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return prices_.col(idx);
    }

    double MarketData::get_price(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return prices_(date_idx, ticker_idx);
    }

    void MarketData::set_bars(const Eigen::MatrixXd &open,
                              const Eigen::MatrixXd &high,
                              const Eigen::MatrixXd &low,
                              const Eigen::MatrixXd &volume)
    {
        auto same_shape = [this](const Eigen::MatrixXd &m)
        {
            return m.rows() == prices_.rows() && m.cols() == prices_.cols();
        };
        if (!same_shape(open) || !same_shape(high) || !same_shape(low) || !same_shape(volume))
        {
            throw std::invalid_argument("OHLCV matrices must match the close price dimensions");
        }
        open_ = open;
        high_ = high;
        low_ = low;
        volume_ = volume;
    }

    void MarketData::set_price(const std::string &ticker, const std::string &date, double price)
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        prices_(date_idx, ticker_idx) = price;
    }

    // ===========================
    // Return Calculation Methods
    // ===========================

    Eigen::MatrixXd MarketData::calculate_returns(ReturnType type) const
    {
        if (prices_.rows() < 2)
        {
            return Eigen::MatrixXd(0, prices_.cols());
        }

        Eigen::MatrixXd returns(prices_.rows() - 1, prices_.cols());

        for (Eigen::Index i = 0; i < prices_.rows() - 1; ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p_t = prices_(i + 1, j);
                double p_tm1 = prices_(i, j);

                if (std::isnan(p_t) || std::isnan(p_tm1) || p_tm1 == 0.0)
                {
                    returns(i, j) = std::numeric_limits<double>::quiet_NaN();
                }
                else if (type == ReturnType::SIMPLE)
                {
                    returns(i, j) = (p_t - p_tm1) / p_tm1;
                }
                else
                {
                    returns(i, j) = std::log(p_t / p_tm1);
                }
            }
        }

        return returns;
    }

    // ================================
    // Data Filtering and Manipulation
    // ================================

    MarketData MarketData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        if (start_date > end_date)
        {
            throw std::invalid_argument("Start date must not be after end date");
        }

        auto first = std::lower_bound(dates_.begin(), dates_.end(), start_date);
        auto last = std::upper_bound(dates_.begin(), dates_.end(), end_date);
        if (first >= last)
        {
            throw std::invalid_argument("No dates between " + start_date + " and " + end_date);
        }

        const auto start_idx = static_cast<Eigen::Index>(std::distance(dates_.begin(), first));
        const auto num_periods = static_cast<Eigen::Index>(std::distance(first, last));

        MarketData filtered(prices_.block(start_idx, 0, num_periods, prices_.cols()),
                            std::vector<std::string>(first, last), tickers_);
        if (has_bars())
        {
            filtered.set_bars(open_.block(start_idx, 0, num_periods, prices_.cols()),
                              high_.block(start_idx, 0, num_periods, prices_.cols()),
                              low_.block(start_idx, 0, num_periods, prices_.cols()),
                              volume_.block(start_idx, 0, num_periods, prices_.cols()));
        }
        return filtered;
    }

    MarketData MarketData::forward_fill() const
    {
        Eigen::MatrixXd filled_prices = prices_;

        for (Eigen::Index j = 0; j < filled_prices.cols(); ++j)
        {
            double last_valid = std::numeric_limits<double>::quiet_NaN();

            for (Eigen::Index i = 0; i < filled_prices.rows(); ++i)
            {
                if (!std::isnan(filled_prices(i, j)))
                {
                    last_valid = filled_prices(i, j);
                }
                else if (!std::isnan(last_valid))
                {
                    filled_prices(i, j) = last_valid;
                }
            }
        }

        return MarketData(filled_prices, dates_, tickers_);
    }

    // ===================
    // Validation Methods
    // ===================

    bool MarketData::is_valid() const
    {
        if (prices_.rows() == 0 || prices_.cols() == 0)
        {
            return false;
        }
        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p = prices_(i, j);
                if (!std::isnan(p) && !(p > 0.0))
                {
                    return false;
                }
            }
        }
        return true;
    }

    size_t MarketData::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Market Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "OHLCV bars: " << (has_bars() ? "yes" : "close only") << "\n";
        std::cout << "==========================\n"
                  << std::endl;
    }

    // =========================
    // Lookup helpers
    // =========================

    int MarketData::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it != ticker_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    int MarketData::find_date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it != date_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    void MarketData::build_index_maps()
    {
        date_index_.clear();
        ticker_index_.clear();

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            date_index_[dates_[i]] = i;
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace portsim

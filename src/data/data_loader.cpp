/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and SimulationConfig
 */

#include "portsim/data/data_loader.hpp"
#include "portsim/backtest/portfolio.hpp"
#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/core/dates.hpp"
#include "portsim/core/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <random>
#include <set>
#include <sstream>

namespace portsim
{

    // =============================================
    // SimulationConfig
    // =============================================

    SimulationConfig SimulationConfig::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw ConfigurationError("simulation configuration must be a JSON object");
        }

        SimulationConfig config;
        try
        {
            const nlohmann::json &data = j.contains("data") ? j["data"] : j;
            config.data_file = data.value("data_file", config.data_file);
            config.start_date = data.value("start_date", config.start_date);
            config.end_date = data.value("end_date", config.end_date);
            config.universe = data.value("universe", config.universe);

            config.initial_cash = j.value("initial_cash", config.initial_cash);
            config.rebalance_frequency = j.value("rebalance_frequency", config.rebalance_frequency);
            config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
            config.allow_short = j.value("allow_short", config.allow_short);
            config.lookback_window = j.value("lookback_window", config.lookback_window);
            config.min_history = j.value("min_history", config.min_history);
            config.fallback = j.value("fallback", config.fallback);
            config.cost_timing = j.value("cost_timing", config.cost_timing);
            config.periods_per_year = j.value("periods_per_year", config.periods_per_year);
            config.momentum_lookback = j.value("momentum_lookback", config.momentum_lookback);
            config.verbose = j.value("verbose", config.verbose);

            const nlohmann::json &costs = j.contains("transaction_costs") ? j["transaction_costs"] : j;
            config.transaction_cost_rate = costs.value("transaction_cost_rate", config.transaction_cost_rate);
            config.transaction_cost_rate = costs.value("commission_rate", config.transaction_cost_rate);
            config.slippage_bps = costs.value("slippage_bps", config.slippage_bps);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigurationError(std::string("invalid configuration field: ") + e.what());
        }

        if (j.contains("risk_model"))
        {
            config.risk_model = risk::RiskModelConfig::from_json(j["risk_model"]);
        }

        // Policy inherits run-level settings it does not override
        nlohmann::json policy_json = j.value("policy", nlohmann::json::object());
        if (policy_json.is_string())
        {
            policy_json = nlohmann::json{{"type", policy_json.get<std::string>()}};
        }
        if (policy_json.is_object())
        {
            if (!j.contains("policy"))
                policy_json["type"] = "equal_weight";
            if (!policy_json.contains("risk_free_rate"))
                policy_json["risk_free_rate"] = config.risk_free_rate;
            if (!policy_json.contains("periods_per_year"))
                policy_json["periods_per_year"] = config.periods_per_year;
            const bool constraint_sets_short = policy_json.contains("constraints") &&
                                               policy_json["constraints"].is_object() &&
                                               policy_json["constraints"].contains("allow_short");
            if (!policy_json.contains("allow_short") && !constraint_sets_short)
                policy_json["allow_short"] = config.allow_short;
        }
        config.policy = policy::PolicyConfig::from_json(policy_json);

        config.validate();
        return config;
    }

    void SimulationConfig::validate() const
    {
        if (!(initial_cash > 0.0))
        {
            throw ConfigurationError("initial_cash must be positive, got: " + std::to_string(initial_cash));
        }
        if (!(transaction_cost_rate >= 0.0 && transaction_cost_rate < 1.0))
        {
            throw ConfigurationError("transaction_cost_rate must be in [0, 1), got: " +
                                     std::to_string(transaction_cost_rate));
        }
        if (!(slippage_bps >= 0.0))
        {
            throw ConfigurationError("slippage_bps must be non-negative, got: " + std::to_string(slippage_bps));
        }
        if (!(risk_free_rate >= 0.0))
        {
            throw ConfigurationError("risk_free_rate must be non-negative, got: " + std::to_string(risk_free_rate));
        }
        if (lookback_window < 2)
        {
            throw ConfigurationError("lookback_window must be at least 2, got: " + std::to_string(lookback_window));
        }
        if (min_history < 0)
        {
            throw ConfigurationError("min_history must be non-negative, got: " + std::to_string(min_history));
        }
        if (periods_per_year < 1)
        {
            throw ConfigurationError("periods_per_year must be at least 1, got: " + std::to_string(periods_per_year));
        }
        if (momentum_lookback < 0)
        {
            throw ConfigurationError("momentum_lookback must be non-negative, got: " +
                                     std::to_string(momentum_lookback));
        }
        // Same parsers the engine applies, so any spelling accepted here also runs
        backtest::SimulationParams::parse_fallback(fallback);
        backtest::SimulationParams::parse_cost_timing(cost_timing);
        backtest::RebalanceConfig::parse_frequency(rebalance_frequency);
        if (!start_date.empty() && !dates::is_valid(start_date))
        {
            throw ConfigurationError("start_date must be YYYY-MM-DD, got: '" + start_date + "'");
        }
        if (!end_date.empty() && !dates::is_valid(end_date))
        {
            throw ConfigurationError("end_date must be YYYY-MM-DD, got: '" + end_date + "'");
        }
    }

    nlohmann::json SimulationConfig::to_json() const
    {
        return nlohmann::json{
            {"data_file", data_file},
            {"start_date", start_date},
            {"end_date", end_date},
            {"universe", universe},
            {"initial_cash", initial_cash},
            {"rebalance_frequency", rebalance_frequency},
            {"transaction_cost_rate", transaction_cost_rate},
            {"slippage_bps", slippage_bps},
            {"risk_free_rate", risk_free_rate},
            {"allow_short", allow_short},
            {"lookback_window", lookback_window},
            {"min_history", min_history},
            {"fallback", fallback},
            {"cost_timing", cost_timing},
            {"periods_per_year", periods_per_year},
            {"momentum_lookback", momentum_lookback},
            {"verbose", verbose},
            {"risk_model", risk_model.to_json()},
            {"policy", policy.to_json()}};
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || to_lower(trim(header[0])) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> all_tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;
        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
            }
            if (column_indices.empty())
            {
                throw std::runtime_error("None of the specified tickers found in CSV");
            }
        }

        // date -> row, so the rows come out sorted
        std::map<std::string, std::vector<double>> rows;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!dates::is_valid(date))
            {
                continue; // Skip invalid dates
            }

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());
            for (size_t idx : column_indices)
            {
                if (idx + 1 < fields.size())
                {
                    row_prices.push_back(safe_stod(fields[idx + 1]));
                }
                else
                {
                    row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                }
            }

            if (!rows.emplace(date, std::move(row_prices)).second)
            {
                throw std::runtime_error("Duplicate date in CSV: " + date);
            }
        }

        if (rows.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> dates_out;
        dates_out.reserve(rows.size());
        Eigen::MatrixXd prices(static_cast<Eigen::Index>(rows.size()),
                               static_cast<Eigen::Index>(selected_tickers.size()));
        Eigen::Index r = 0;
        for (const auto &[date, values] : rows)
        {
            dates_out.push_back(date);
            for (size_t c = 0; c < values.size(); ++c)
            {
                prices(r, static_cast<Eigen::Index>(c)) = values[c];
            }
            ++r;
        }

        return MarketData(prices, dates_out, selected_tickers);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        // Locate columns by header name
        auto header = parse_csv_line(line);
        std::map<std::string, size_t> column;
        for (size_t i = 0; i < header.size(); ++i)
        {
            column[to_lower(trim(header[i]))] = i;
        }
        if (!column.count("date") || !(column.count("ticker") || column.count("symbol")))
        {
            throw std::runtime_error("Long CSV needs 'date' and 'ticker' columns");
        }
        const size_t date_col = column["date"];
        const size_t ticker_col = column.count("ticker") ? column["ticker"] : column["symbol"];

        size_t close_col = 0;
        if (column.count("close"))
            close_col = column["close"];
        else if (column.count("price"))
            close_col = column["price"];
        else if (header.size() == 3)
            close_col = 2;
        else
            throw std::runtime_error("Long CSV needs a 'close' or 'price' column");

        const bool has_ohlcv = column.count("open") && column.count("high") &&
                               column.count("low") && column.count("volume");

        enum Field { OPEN, HIGH, LOW, CLOSE, VOLUME, NUM_FIELDS };
        using Bar = std::array<double, NUM_FIELDS>;
        std::map<std::string, std::map<std::string, Bar>> data_map; // date -> ticker -> bar
        std::set<std::string> all_tickers;

        auto field_at = [](const std::vector<std::string> &fields, size_t idx)
        {
            return idx < fields.size() ? safe_stod(fields[idx]) : std::numeric_limits<double>::quiet_NaN();
        };

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() <= std::max(date_col, ticker_col))
                continue;

            std::string date = trim(fields[date_col]);
            std::string ticker = trim(fields[ticker_col]);
            if (!dates::is_valid(date) || ticker.empty())
                continue;

            // Filter by tickers if specified
            if (!tickers.empty() &&
                std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                continue;
            }

            Bar bar;
            bar[CLOSE] = field_at(fields, close_col);
            if (has_ohlcv)
            {
                bar[OPEN] = field_at(fields, column["open"]);
                bar[HIGH] = field_at(fields, column["high"]);
                bar[LOW] = field_at(fields, column["low"]);
                bar[VOLUME] = field_at(fields, column["volume"]);
            }
            else
            {
                bar[OPEN] = bar[HIGH] = bar[LOW] = bar[CLOSE];
                bar[VOLUME] = std::numeric_limits<double>::quiet_NaN();
            }

            data_map[date][ticker] = bar;
            all_tickers.insert(ticker);
        }

        if (data_map.empty() || all_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> dates_out;
        for (const auto &entry : data_map)
        {
            dates_out.push_back(entry.first);
        }
        std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());

        const auto rows = static_cast<Eigen::Index>(dates_out.size());
        const auto cols = static_cast<Eigen::Index>(ticker_vec.size());
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::array<Eigen::MatrixXd, NUM_FIELDS> m;
        for (auto &matrix : m)
        {
            matrix = Eigen::MatrixXd::Constant(rows, cols, nan);
        }

        for (Eigen::Index i = 0; i < rows; ++i)
        {
            const auto &by_ticker = data_map[dates_out[static_cast<size_t>(i)]];
            for (Eigen::Index j = 0; j < cols; ++j)
            {
                auto it = by_ticker.find(ticker_vec[static_cast<size_t>(j)]);
                if (it == by_ticker.end())
                    continue;
                for (int f = 0; f < NUM_FIELDS; ++f)
                {
                    m[f](i, j) = it->second[f];
                }
            }
        }

        MarketData market_data(m[CLOSE], dates_out, ticker_vec);
        if (has_ohlcv)
        {
            market_data.set_bars(m[OPEN], m[HIGH], m[LOW], m[VOLUME]);
        }
        return market_data;
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    MarketData DataLoader::load_csv(const std::string &filepath,
                                    const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        auto header = parse_csv_line(line);
        if (header.size() >= 3)
        {
            const std::string second = to_lower(trim(header[1]));
            if (second == "ticker" || second == "symbol")
            {
                return load_csv_long(filepath, tickers);
            }
        }
        return load_csv_wide(filepath, tickers);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
        }
        return j;
    }

    SimulationConfig DataLoader::load_config(const std::string &config_path)
    {
        return SimulationConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint32_t seed)
    {
        if (tickers.empty() || num_days == 0)
        {
            throw std::invalid_argument("Synthetic data needs at least one ticker and one day");
        }
        if (volatility < 0.0)
        {
            throw std::invalid_argument("volatility must be non-negative");
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        // Weekdays only
        std::vector<std::string> dates_out;
        dates_out.reserve(num_days);
        std::string date = start_date;
        while (dates_out.size() < num_days)
        {
            if (dates::day_of_week(date) < 5)
            {
                dates_out.push_back(date);
            }
            date = dates::add_days(date, 1);
        }

        const auto rows = static_cast<Eigen::Index>(num_days);
        const auto cols = static_cast<Eigen::Index>(tickers.size());
        Eigen::MatrixXd prices(rows, cols);

        // Geometric Brownian motion from 100
        for (Eigen::Index j = 0; j < cols; ++j)
        {
            prices(0, j) = 100.0;
            for (Eigen::Index i = 1; i < rows; ++i)
            {
                double return_val = std::max(dist(gen), -0.95);
                prices(i, j) = prices(i - 1, j) * (1.0 + return_val);
            }
        }

        return MarketData(prices, dates_out, tickers);
    }

    // ==================
    // Export
    // ==================

    void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : data.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &prices = data.close_prices();
        const auto &dates_in = data.get_dates();
        file << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < dates_in.size(); ++i)
        {
            file << dates_in[i];
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                file << ",";
                const double p = prices(static_cast<Eigen::Index>(i), j);
                if (!std::isnan(p))
                {
                    file << p;
                }
            }
            file << "\n";
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string out = str;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || to_lower(trimmed) == "nan" || to_lower(trimmed) == "null")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace portsim

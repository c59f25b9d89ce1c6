/**
 * @file allocation_policy.hpp
 * @brief Abstract interface for target-weight allocation policies
 *
 * A policy maps a trailing window of per-asset returns to target weights
 * that sum to one. Policies hold only immutable parameters, so one policy
 * object may be shared by portfolios running on different threads.
 */

#pragma once

#include "portsim/risk/risk_model.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace portsim
{
    namespace policy
    {

        /**
         * @struct PolicyConstraints
         * @brief Weight bounds applied by the optimizing policies
         *
         * Long-only bounds are [min_weight, max_weight]; with allow_short the
         * bounds become [-max_weight, max_weight].
         */
        struct PolicyConstraints
        {
            double min_weight = 0.0;
            double max_weight = 1.0;
            bool allow_short = false;

            /**
             * @throws ConfigurationError if the bounds are inconsistent
             */
            void validate() const;

            /**
             * @throws ConfigurationError if n assets cannot satisfy sum(w) = 1
             */
            void check_feasible(Eigen::Index n) const;

            double lower_bound() const { return allow_short ? -max_weight : min_weight; }
            double upper_bound() const { return max_weight; }

            static PolicyConstraints from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct ReturnsHistory
         * @brief Trailing window of periodic returns, one column per symbol
         */
        struct ReturnsHistory
        {
            std::vector<std::string> symbols;
            Eigen::MatrixXd returns; ///< T x N, most recent row last
            std::vector<bool> eligible; ///< Per symbol; empty means all may be held

            Eigen::Index num_assets() const { return static_cast<Eigen::Index>(symbols.size()); }
            Eigen::Index num_observations() const { return returns.rows(); }
            bool is_eligible(size_t i) const { return eligible.empty() || eligible[i]; }
            Eigen::Index num_eligible() const;
        };

        /**
         * @struct AllocationResult
         * @brief Target weights plus diagnostics
         */
        struct AllocationResult
        {
            std::vector<std::string> symbols;
            Eigen::VectorXd weights;      ///< Same order as symbols
            bool converged = true;        ///< False when an iterative method hit its cap
            bool fallback_used = false;   ///< True when a degenerate case used a simpler rule
            int iterations = 0;
            std::string message;
            double expected_return = 0.0; ///< Annualised, 0 when moments were not estimated
            double volatility = 0.0;      ///< Annualised, 0 when moments were not estimated

            std::map<std::string, double> as_map() const;
            double weight_of(const std::string &symbol) const;
        };

        /**
         * @struct MomentEstimate
         * @brief Annualised expected returns and covariance of a window
         */
        struct MomentEstimate
        {
            Eigen::VectorXd expected_returns;
            Eigen::MatrixXd covariance;
        };

        /**
         * @class AllocationPolicy
         * @brief Abstract base class for allocation policies
         *
         * Usage Example:
         * @code
         * MinVariancePolicy policy;
         * AllocationResult target = policy.optimize(history);
         * double w = target.weight_of("AAPL");
         * @endcode
         */
        class AllocationPolicy
        {
        public:
            /**
             * @param constraints Weight bounds
             * @param risk_model Covariance estimator, sample covariance when null
             * @param periods_per_year Annualisation factor for the window statistics
             */
            explicit AllocationPolicy(const PolicyConstraints &constraints = PolicyConstraints(),
                                      std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                      int periods_per_year = 252);

            virtual ~AllocationPolicy() = default;

            /**
             * @brief Compute target weights
             * @param history Trailing returns window
             * @param current_weights Current holdings in history.symbols order (may be empty)
             * @throws ConfigurationError if the asset set is empty or constraints are infeasible
             * @throws OptimizationError if the problem cannot be solved
             */
            virtual AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const = 0;

            /**
             * @brief optimize() restricted to the eligible symbols of the window
             *
             * Ineligible symbols get weight 0 and take no part in the estimate;
             * the eligible weights still sum to one. Without a mask this is
             * optimize().
             *
             * @throws ConfigurationError if the mask has the wrong size or excludes every symbol
             * @throws OptimizationError as optimize()
             */
            AllocationResult allocate(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const;

            virtual std::string get_name() const = 0;

            virtual nlohmann::json get_parameters() const = 0;

            /// False for policies that ignore the returns window.
            virtual bool uses_history() const { return true; }

            const PolicyConstraints &constraints() const { return constraints_; }
            int periods_per_year() const { return periods_per_year_; }
            const risk::RiskModel &risk_model() const { return *risk_model_; }

        protected:
            /**
             * @brief Validate symbols/returns shape
             * @throws ConfigurationError on an empty universe
             * @throws std::invalid_argument on shape mismatch
             */
            static void validate_history(const ReturnsHistory &history,
                                         const Eigen::VectorXd &current_weights);

            /**
             * @brief Annualised mean and covariance of the window
             * @throws OptimizationError if the window cannot support an estimate
             */
            MomentEstimate estimate_moments(const ReturnsHistory &history) const;

            /**
             * @throws OptimizationError if the covariance is singular
             */
            void require_non_singular(const Eigen::MatrixXd &covariance) const;

            /// Clip numerical noise to the bounds and rescale to sum to one.
            Eigen::VectorXd clean_weights(const Eigen::VectorXd &raw) const;

            AllocationResult make_result(const ReturnsHistory &history,
                                         const Eigen::VectorXd &weights,
                                         const MomentEstimate *moments) const;

            nlohmann::json base_parameters() const;

            static Eigen::VectorXd equal_weights(Eigen::Index n);

        private:
            PolicyConstraints constraints_;
            std::shared_ptr<const risk::RiskModel> risk_model_;
            int periods_per_year_;
        };

    } // namespace policy
} // namespace portsim

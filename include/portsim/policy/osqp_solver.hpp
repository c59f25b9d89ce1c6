/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (1.x API) for the quadratic programs behind the
 * mean-variance, minimum-variance and maximum-Sharpe policies.
 */

#pragma once

#include "portsim/policy/quadratic_problem.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace portsim
{
    namespace policy
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using OSQP library
         *
         * Usage Example:
         * @code
         * OSQPSolver solver;
         * QuadraticProblem problem = ...;
         * SolverResult result = solver.solve(problem);
         * if (result.success) {
         *     std::cout << result.solution.transpose() << "\n";
         * }
         * @endcode
         *
         * Each call to solve() builds and releases its own OSQP workspace, so
         * a const solver can be shared across threads.
         */
        class OSQPSolver
        {
        public:
            OSQPSolver() = default;
            explicit OSQPSolver(const SolverOptions &options);

            void set_options(const SolverOptions &options);
            const SolverOptions &options() const { return options_; }

            /**
             * @brief Solve quadratic programming problem
             * @return Solution with status, iterations, and objective value;
             *         success is false when OSQP does not report a solution
             * @throws std::invalid_argument if the problem is ill-formed
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_;

            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             *
             * For symmetric matrices only the upper triangle is stored.
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only);

            /**
             * @brief Build A = [A_eq; A_ineq; I] with bounds l, u
             * @return Number of constraint rows (m)
             */
            static OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace policy
} // namespace portsim

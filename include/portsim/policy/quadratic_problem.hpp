/**
 * @file quadratic_problem.hpp
 * @brief Problem/option/result structures for quadratic programs
 *
 * Problems have the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq
 *               b_ineq_lower <= A_ineq * x <= b_ineq_upper
 *               lower_bounds <= x <= upper_bounds
 *
 * Any constraint block may be left empty. Empty bound vectors mean the
 * variable is unbounded on that side.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace portsim
{
    namespace policy
    {

        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Empty means -inf
            Eigen::VectorXd b_ineq_upper; ///< Empty means +inf

            Eigen::VectorXd lower_bounds; ///< Empty means -inf
            Eigen::VectorXd upper_bounds; ///< Empty means +inf

            /**
             * @brief Validate problem dimensions and values
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        struct SolverOptions
        {
            int max_iterations = 10000; ///< Maximum ADMM iterations
            double tolerance = 1e-7;    ///< Absolute and relative tolerance
            bool polish = true;         ///< Run solution polishing
            bool verbose = false;       ///< Print solver progress
        };

        struct SolverResult
        {
            Eigen::VectorXd solution;     ///< Optimal solution
            double objective_value = 0.0; ///< Final objective value
            bool success = false;         ///< Solved (possibly inaccurately)
            int iterations = 0;           ///< Number of iterations
            std::string message;          ///< Solver status text
        };

    } // namespace policy
} // namespace portsim

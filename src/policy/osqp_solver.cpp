/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "portsim/policy/osqp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace portsim
{
    namespace policy
    {

        namespace
        {
            struct WorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    if (work != nullptr)
                    {
                        osqp_cleanup(work);
                    }
                }
            };

            using WorkspacePtr = std::unique_ptr<::OSQPSolver, WorkspaceDeleter>;

            constexpr double kZeroThreshold = 1e-14;
        } // namespace

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();
            if (n == 0)
            {
                throw std::invalid_argument("Quadratic problem has no variables");
            }
            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument(
                    "P must be " + std::to_string(n) + "x" + std::to_string(n) +
                    ", got " + std::to_string(P.rows()) + "x" + std::to_string(P.cols()));
            }
            if (A_eq.size() > 0 && (A_eq.cols() != n || b_eq.size() != A_eq.rows()))
            {
                throw std::invalid_argument("Equality constraint dimensions are inconsistent");
            }
            if (A_ineq.size() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw std::invalid_argument("Inequality constraint matrix has wrong column count");
                }
                if ((b_ineq_lower.size() > 0 && b_ineq_lower.size() != A_ineq.rows()) ||
                    (b_ineq_upper.size() > 0 && b_ineq_upper.size() != A_ineq.rows()))
                {
                    throw std::invalid_argument("Inequality bound sizes do not match A_ineq rows");
                }
            }
            if ((lower_bounds.size() > 0 && lower_bounds.size() != n) ||
                (upper_bounds.size() > 0 && upper_bounds.size() != n))
            {
                throw std::invalid_argument("Variable bound sizes do not match problem size");
            }
            if (!P.allFinite() || !q.allFinite())
            {
                throw std::invalid_argument("Objective contains NaN or Inf values");
            }
        }

        OSQPSolver::OSQPSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(static_cast<size_t>(cols) + 1);
            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;
                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    double val = dense(i, j);
                    if (std::abs(val) > kZeroThreshold)
                    {
                        data.push_back(val);
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = (problem.A_eq.size() > 0) ? problem.A_eq.rows() : 0;
            const Eigen::Index n_ineq = (problem.A_ineq.size() > 0) ? problem.A_ineq.rows() : 0;
            const Eigen::Index m = n_eq + n_ineq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            A_indptr.push_back(0);
            l.assign(static_cast<size_t>(m), -OSQP_INFTY);
            u.assign(static_cast<size_t>(m), OSQP_INFTY);

            for (Eigen::Index j = 0; j < n; ++j)
            {
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    double val = problem.A_eq(i, j);
                    if (std::abs(val) > kZeroThreshold)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                for (Eigen::Index i = 0; i < n_ineq; ++i)
                {
                    double val = problem.A_ineq(i, j);
                    if (std::abs(val) > kZeroThreshold)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(n_eq + i));
                    }
                }

                // box row for x_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + n_ineq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[static_cast<size_t>(i)] = problem.b_eq(i);
                u[static_cast<size_t>(i)] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n_ineq; ++i)
            {
                const auto row = static_cast<size_t>(n_eq + i);
                if (problem.b_ineq_lower.size() > 0)
                    l[row] = problem.b_ineq_lower(i);
                if (problem.b_ineq_upper.size() > 0)
                    u[row] = problem.b_ineq_upper(i);
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                const auto row = static_cast<size_t>(n_eq + n_ineq + i);
                if (problem.lower_bounds.size() > 0)
                    l[row] = problem.lower_bounds(i);
                if (problem.upper_bounds.size() > 0)
                    u[row] = problem.upper_bounds(i);
            }

            // callers may use +/- infinity for open sides
            for (size_t i = 0; i < l.size(); ++i)
            {
                l[i] = std::max(l[i], static_cast<OSQPFloat>(-OSQP_INFTY));
                u[i] = std::min(u[i], static_cast<OSQPFloat>(OSQP_INFTY));
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const Eigen::Index n = problem.q.size();

            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + n);

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;
            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // CSC, not triplet

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings{};
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = static_cast<OSQPInt>(options_.max_iterations);
            settings.polishing = options_.polish ? 1 : 0;

            ::OSQPSolver *raw_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            WorkspacePtr work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.message = "OSQP setup failed with code " + std::to_string(exit_flag);
                return result;
            }

            osqp_solve(work.get());

            result.solution = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                result.solution(i) = work->solution->x[i];
            }

            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.message = work->info->status;
            result.success = (work->info->status_val == OSQP_SOLVED ||
                              work->info->status_val == OSQP_SOLVED_INACCURATE) &&
                             result.solution.allFinite();

            return result;
        }

    } // namespace policy
} // namespace portsim

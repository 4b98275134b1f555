/**
 * milp_model_general.hpp
 *
 * This file contains all general classes / structs required
 * by the MILP model implementations, i.e. the interface between
 * the model assembly and a solver.
 */

#ifndef MILP_MODEL_GENERAL_HPP
#define MILP_MODEL_GENERAL_HPP

#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>


/*!
 * Type of a decision variable.
 */
enum struct VariableType : char {
    Continuous = 'C',
    Binary     = 'B'
};

/*!
 * Sense of a linear constraint.
 */
enum struct ConstraintSense : char {
    Equal        = 'E', ///< row == rhs
    LessEqual    = 'L', ///< row <= rhs
    GreaterEqual = 'G'  ///< row >= rhs
};

/**
 * Sparse vector of (index, coefficient) pairs.
 * Depending on the context, the indices refer to constraints (column of a
 * new variable) or to variables (row of a new constraint).
 * Duplicated indices are summed up.
 */
struct SparseVector {
    std::vector<int>    indices;
    std::vector<double> values;
};


/**
 * This class represents the base class for a model that can take a mixed-integer linear program.
 *
 * Infinite bounds are always given as std::numeric_limits<double>::infinity(),
 * implementations map them to the infinity value of the used solver.
 */
class BaseMILPModel {
    public:
        virtual ~BaseMILPModel() = default;

        /**
         * Adds new variables to the model. All non-empty vectors must have the same size as names.
         * An empty vector selects the default value for all new variables, i.e. lower bound 0.0,
         * upper bound +inf, continuous type, objective coefficient 0.0 or an empty column.
         *
         * @param names: Names of the new variables
         * @param lower_bounds: Lower bound per new variable
         * @param upper_bounds: Upper bound per new variable
         * @param types: Type per new variable
         * @param objective: Objective coefficient per new variable
         * @param columns: Coefficients of the new variable in already existing constraints
         *
         * @return: Returns the indices of the new variables, in the order of the parameter names
         */
        virtual std::vector<int> add_variables(
            const std::vector<std::string>&     names,
            const std::vector<double>&          lower_bounds,
            const std::vector<double>&          upper_bounds,
            const std::vector<VariableType>&    types,
            const std::vector<double>&          objective,
            const std::vector<SparseVector>&    columns
        ) = 0;

        /**
         * Adds new constraints to the model. All non-empty vectors must have the same size as names.
         * An empty rhs vector sets all right-hand sides to 0.0, empty rows create empty constraints.
         *
         * @return: Returns the indices of the new constraints, in the order of the parameter names
         */
        virtual std::vector<int> add_constraints(
            const std::vector<std::string>&     names,
            const std::vector<ConstraintSense>& senses,
            const std::vector<double>&          rhs,
            const std::vector<SparseVector>&    rows
        ) = 0;

        /**
         * Returns the right-hand sides of the given constraints
         */
        virtual std::vector<double> get_constraint_rhs(const std::vector<int>& indices) const = 0;

        /**
         * Sets the right-hand sides for a list of (constraint index, new value) pairs
         */
        virtual void set_constraint_rhs(const std::vector<std::pair<int, double>>& new_rhs) = 0;

        virtual size_t get_n_variables() const = 0;
        virtual size_t get_n_constraints() const = 0;

        /**
         * Writes the model in the CPLEX LP format to the given file.
         * @return: Returns true on success, false otherwise
         */
        virtual bool write_lp(const std::filesystem::path& filepath) const = 0;

        /**
         * Solves the model with the given time limit in seconds.
         * A pure model without an attached solver returns false.
         *
         * @return: Returns true if a solution is available afterwards. Throws InfeasibleScheduleError
         *          if the solver proves that the model is infeasible.
         */
        virtual bool solve(double time_limit_s) {
            std::cerr << "Error: No solver is attached to this model. A time limit of " << time_limit_s << " s was given." << std::endl;
            return false;
        }

        /**
         * Returns the variable values of the last successful call of solve(),
         * in the order of the variable indices.
         */
        virtual std::vector<double> get_variable_values() const { return {}; }

        /**
         * Returns the objective value of the last successful call of solve()
         */
        virtual double get_objective_value() const { return std::numeric_limits<double>::quiet_NaN(); }

    protected:
        /**
         * Returns vec[i] if vec is not empty, otherwise the default value.
         * Throws std::invalid_argument if vec has neither size 0 nor size n.
         */
        template <typename T>
        static T value_or_default(const std::vector<T>& vec, size_t i, size_t n, const T& default_value, const char* argument_name) {
            if (vec.empty())
                return default_value;
            if (vec.size() != n)
                throw std::invalid_argument(std::string("Argument '") + argument_name + "' has a wrong size.");
            return vec[i];
        }
};

#endif

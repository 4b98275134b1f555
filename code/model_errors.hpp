/**
 * model_errors.hpp
 *
 * This file contains the exceptions that can be thrown during
 * the assembly of a demand-response model and by the solver
 * backends.
 */

#ifndef MODEL_ERRORS_HPP
#define MODEL_ERRORS_HPP

#include <stdexcept>
#include <string>


/**
 * Base class of all errors raised while a model is built.
 * Any of them aborts the complete model build.
 */
class ModelAssemblyError : public std::runtime_error {
    public:
        explicit ModelAssemblyError(const std::string& what_arg) : std::runtime_error(what_arg) {}
};

/**
 * A lookup in the index registry references a key that has never been declared.
 * This always indicates an assembly-order defect (e.g. a device contributed
 * before the linking constraints of its household exist).
 */
class UnknownKeyError : public ModelAssemblyError {
    public:
        explicit UnknownKeyError(const std::string& what_arg) : ModelAssemblyError(what_arg) {}
};

/**
 * A key is declared a second time, i.e. two devices or households share a label.
 */
class DuplicateKeyError : public ModelAssemblyError {
    public:
        explicit DuplicateKeyError(const std::string& what_arg) : ModelAssemblyError(what_arg) {}
};

/**
 * Malformed or inconsistent device, household or aggregator parameters.
 * It is raised before the model or the registry are modified.
 */
class ParameterError : public ModelAssemblyError {
    public:
        explicit ParameterError(const std::string& what_arg) : ModelAssemblyError(what_arg) {}
};

/**
 * Raised by a solver backend if the solver proves that the declared
 * constraints admit no feasible schedule.
 */
class InfeasibleScheduleError : public std::runtime_error {
    public:
        explicit InfeasibleScheduleError(const std::string& what_arg) : std::runtime_error(what_arg) {}
};

#endif

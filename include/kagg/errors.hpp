#pragma once

/// @file include/kagg/errors.hpp
/// @brief Exceptions for caller-input contract violations.
///
/// Only contract violations throw. Chain-dependent outcomes (Krylov
/// breakdown, a complex dominant eigenpair, an exhausted schedule) are
/// reported through status enums and `std::optional` and never throw.

#include <stdexcept>
#include <string>

namespace kagg {

/// Base class of every exception thrown by kagg.
class AggregationError : public std::runtime_error {
public:
    explicit AggregationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Shapes of the inputs do not agree (p₀ vs. chain, Π vs. A, non-square P).
class DimensionError : public AggregationError {
public:
    using AggregationError::AggregationError;
};

/// Input is well-shaped but unusable: zero or non-finite p₀, negative or
/// non-finite transition probabilities.
class DegenerateInputError : public AggregationError {
public:
    using AggregationError::AggregationError;
};

/// Sizing configuration is invalid: empty or non-ascending checkpoint
/// schedule, cap not above the largest checkpoint, ε ≤ 0, size < 1.
class ScheduleError : public AggregationError {
public:
    using AggregationError::AggregationError;
};

} // namespace kagg

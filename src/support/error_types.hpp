// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

namespace lensolve {

/// Error codes for configuration and input validation failures
///
/// These are the only errors that abort a solve call; they are reported
/// before any candidate is generated.
enum class ValidationErrorCode {
    InvalidGridResolution,
    InvalidHalfWidth,
    InvalidGridCenter,
    InvalidJitter,
    InvalidMaxIterations,
    InvalidConvergenceTolerance,
    InvalidMergeDistance,
    InvalidDampingThreshold,
    InvalidExpectedImages,
    InvalidTriangleSearch,
    NonFiniteSource,
    ParameterCountMismatch,
    BatchSizeMismatch,
    MissingDeflectionField
};

/// Detailed validation error
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Offending element for batch errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Terminal and non-terminal states of a refinement candidate
enum class CandidateStatus : unsigned char {
    Running,
    Converged,
    Diverged,
    MaxIterationsExceeded,
    OutOfDomain
};

/// Completeness diagnostic attached to every SolveResult
///
/// Never raised as an error: an empty or short image set may be genuine,
/// or may come from an under-resolved search. The caller decides.
enum class SolveDiagnostic {
    Complete,
    NoImages,
    FewerThanExpected,
    ImagesOutsideDomain  ///< A root was found beyond the search box; widen it
};

constexpr std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::InvalidGridResolution:       return "InvalidGridResolution";
        case ValidationErrorCode::InvalidHalfWidth:            return "InvalidHalfWidth";
        case ValidationErrorCode::InvalidGridCenter:           return "InvalidGridCenter";
        case ValidationErrorCode::InvalidJitter:               return "InvalidJitter";
        case ValidationErrorCode::InvalidMaxIterations:        return "InvalidMaxIterations";
        case ValidationErrorCode::InvalidConvergenceTolerance: return "InvalidConvergenceTolerance";
        case ValidationErrorCode::InvalidMergeDistance:        return "InvalidMergeDistance";
        case ValidationErrorCode::InvalidDampingThreshold:     return "InvalidDampingThreshold";
        case ValidationErrorCode::InvalidExpectedImages:       return "InvalidExpectedImages";
        case ValidationErrorCode::InvalidTriangleSearch:       return "InvalidTriangleSearch";
        case ValidationErrorCode::NonFiniteSource:             return "NonFiniteSource";
        case ValidationErrorCode::ParameterCountMismatch:      return "ParameterCountMismatch";
        case ValidationErrorCode::BatchSizeMismatch:           return "BatchSizeMismatch";
        case ValidationErrorCode::MissingDeflectionField:      return "MissingDeflectionField";
    }
    return "Unknown";
}

constexpr std::string_view to_string(CandidateStatus status) noexcept {
    switch (status) {
        case CandidateStatus::Running:               return "Running";
        case CandidateStatus::Converged:             return "Converged";
        case CandidateStatus::Diverged:              return "Diverged";
        case CandidateStatus::MaxIterationsExceeded: return "MaxIterationsExceeded";
        case CandidateStatus::OutOfDomain:           return "OutOfDomain";
    }
    return "Unknown";
}

constexpr std::string_view to_string(SolveDiagnostic diagnostic) noexcept {
    switch (diagnostic) {
        case SolveDiagnostic::Complete:          return "Complete";
        case SolveDiagnostic::NoImages:          return "NoImages";
        case SolveDiagnostic::FewerThanExpected: return "FewerThanExpected";
        case SolveDiagnostic::ImagesOutsideDomain: return "ImagesOutsideDomain";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, CandidateStatus status) {
    return os << to_string(status);
}

inline std::ostream& operator<<(std::ostream& os, SolveDiagnostic diagnostic) {
    return os << to_string(diagnostic);
}

} // namespace lensolve

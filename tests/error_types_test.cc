// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace lensolve {
namespace {

TEST(ValidationErrorTest, DefaultsValueAndIndex) {
    ValidationError err(ValidationErrorCode::InvalidGridResolution);
    EXPECT_EQ(err.code, ValidationErrorCode::InvalidGridResolution);
    EXPECT_DOUBLE_EQ(err.value, 0.0);
    EXPECT_EQ(err.index, 0u);
}

TEST(ValidationErrorTest, StreamsCodeValueAndIndex) {
    ValidationError err(ValidationErrorCode::NonFiniteSource, 1.5, 3);
    std::ostringstream os;
    os << err;
    EXPECT_EQ(os.str(), "ValidationError{code=NonFiniteSource, value=1.5, index=3}");
}

TEST(ErrorTypesTest, EnumNames) {
    EXPECT_EQ(to_string(ValidationErrorCode::BatchSizeMismatch), "BatchSizeMismatch");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidMergeDistance), "InvalidMergeDistance");
    EXPECT_EQ(to_string(CandidateStatus::OutOfDomain), "OutOfDomain");
    EXPECT_EQ(to_string(CandidateStatus::MaxIterationsExceeded), "MaxIterationsExceeded");
    EXPECT_EQ(to_string(SolveDiagnostic::FewerThanExpected), "FewerThanExpected");
    EXPECT_EQ(to_string(SolveDiagnostic::ImagesOutsideDomain), "ImagesOutsideDomain");

    std::ostringstream os;
    os << CandidateStatus::Converged << " " << SolveDiagnostic::NoImages;
    EXPECT_EQ(os.str(), "Converged NoImages");
}

}  // namespace
}  // namespace lensolve

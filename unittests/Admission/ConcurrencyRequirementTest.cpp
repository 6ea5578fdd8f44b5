//===- unittests/Admission/ConcurrencyRequirementTest.cpp -----------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "sandlane/Admission/AdmissionError.h"
#include "sandlane/Admission/ConcurrencyRequirement.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace sandlane;
using namespace sandlane::admission;

namespace {

static ConcurrencyRequirement parseOrDie(StringRef text) {
  auto result = ConcurrencyRequirement::parse(text);
  if (!result) {
    ADD_FAILURE() << "unable to parse '" << text.str() << "': "
                  << llvm::toString(result.takeError());
    return ConcurrencyRequirement();
  }
  return *result;
}

static AdmissionErrorCode parseErrorCode(StringRef text) {
  auto result = ConcurrencyRequirement::parse(text);
  if (result) {
    ADD_FAILURE() << "unexpectedly parsed '" << text.str() << "'";
    return AdmissionErrorCode::Unsatisfiable;
  }
  AdmissionErrorCode code = AdmissionErrorCode::Unsatisfiable;
  llvm::handleAllErrors(result.takeError(), [&](const AdmissionError& error) {
      code = error.getCode();
    });
  return code;
}

TEST(ConcurrencyRequirementTest, parse) {
  EXPECT_EQ(parseOrDie("exclusive"), ConcurrencyRequirement::makeExclusive());
  EXPECT_EQ(parseOrDie("exactly(3)"), ConcurrencyRequirement::makeExactly(3));
  EXPECT_EQ(parseOrDie(" range( 1 , 4 ) "),
            ConcurrencyRequirement::makeRange(1, 4));
  EXPECT_EQ(parseOrDie("range(2,2)"), ConcurrencyRequirement::makeRange(2, 2));
}

TEST(ConcurrencyRequirementTest, parseRejects) {
  for (StringRef text: { "", "exactly", "exactly(0)", "exactly(-1)",
                         "exactly(x)", "range(0,3)", "range(4,1)",
                         "range(1)", "some(2)" }) {
    EXPECT_EQ(parseErrorCode(text), AdmissionErrorCode::InvalidRequirement)
      << text.str();
  }
}

TEST(ConcurrencyRequirementTest, textualForm) {
  for (StringRef text: { "exclusive", "exactly(7)", "range(2,5)" }) {
    EXPECT_EQ(parseOrDie(text).str(), text.str());
  }
}

TEST(ConcurrencyRequirementTest, validity) {
  EXPECT_TRUE(ConcurrencyRequirement().isValid());
  EXPECT_EQ(ConcurrencyRequirement().getCount(), 1U);
  EXPECT_FALSE(ConcurrencyRequirement::makeExactly(0).isValid());
  EXPECT_FALSE(ConcurrencyRequirement::makeRange(3, 2).isValid());

  EXPECT_TRUE(ConcurrencyRequirement::makeExclusive().isSatisfiable(1));
  EXPECT_TRUE(ConcurrencyRequirement::makeExactly(4).isSatisfiable(4));
  EXPECT_FALSE(ConcurrencyRequirement::makeExactly(5).isSatisfiable(4));
  EXPECT_TRUE(ConcurrencyRequirement::makeRange(4, 16).isSatisfiable(4));
  EXPECT_FALSE(ConcurrencyRequirement::makeRange(5, 16).isSatisfiable(4));
}

TEST(ConcurrencyRequirementTest, grantableUnits) {
  auto range = ConcurrencyRequirement::makeRange(1, 4);
  EXPECT_EQ(range.getGrantableUnits(5, 8), 4U);
  EXPECT_EQ(range.getGrantableUnits(2, 8), 2U);
  EXPECT_EQ(range.getGrantableUnits(0, 8), 0U);

  auto exactly = ConcurrencyRequirement::makeExactly(3);
  EXPECT_EQ(exactly.getGrantableUnits(3, 8), 3U);
  EXPECT_EQ(exactly.getGrantableUnits(2, 8), 0U);

  auto exclusive = ConcurrencyRequirement::makeExclusive();
  EXPECT_EQ(exclusive.getGrantableUnits(8, 8), 8U);
  EXPECT_EQ(exclusive.getGrantableUnits(7, 8), 0U);
}

TEST(ConcurrencyRequirementTest, substitutePlaceholder) {
  std::vector<std::string> args{
    "pytest", "-n", "{sandlane_concurrency}",
    "--workers={sandlane_concurrency}:{sandlane_concurrency}", "plain" };
  EXPECT_EQ(substituteConcurrencyPlaceholder(
                args, DefaultConcurrencyPlaceholder, 4), 3U);
  EXPECT_EQ(args, (std::vector<std::string>{
        "pytest", "-n", "4", "--workers=4:4", "plain" }));

  // Nothing to replace.
  EXPECT_EQ(substituteConcurrencyPlaceholder(
                args, DefaultConcurrencyPlaceholder, 4), 0U);
  EXPECT_EQ(substituteConcurrencyPlaceholder(args, "", 4), 0U);

  // Custom tokens.
  std::vector<std::string> custom{ "make", "-j@JOBS@" };
  EXPECT_EQ(substituteConcurrencyPlaceholder(custom, "@JOBS@", 12), 1U);
  EXPECT_EQ(custom[1], "-j12");
}

}

//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "cli/cli_args.hpp"

#include <gtest/gtest.h>

#include <limits>

#include "type/errors.hpp"

namespace mangatint {
TEST(CliArgsTests, ParseNumber_AcceptsDecimals_RejectsTrailingText) {
  EXPECT_DOUBLE_EQ(ParseNumber("--strength", "0.45"), 0.45);
  EXPECT_THROW(ParseNumber("--strength", "0.4x"), InvalidRequestError);
  EXPECT_THROW(ParseNumber("--strength", ""), InvalidRequestError);
  EXPECT_THROW(ParseNumber("--guidance", "inf"), InvalidRequestError);
  EXPECT_THROW(ParseNumber("--guidance", "nan"), InvalidRequestError);
}

TEST(CliArgsTests, ParseInteger_AcceptsWholeValues) {
  EXPECT_EQ(ParseInteger("--steps", "25"), 25);
  EXPECT_EQ(ParseInteger("--max-side", "1024.0"), 1024);
  EXPECT_EQ(ParseInteger("--ink-threshold", "0"), 0);
}

TEST(CliArgsTests, ParseInteger_Fraction_ThrowsInvalidRequest) {
  EXPECT_THROW(ParseInteger("--steps", "25.7"), InvalidRequestError);
  EXPECT_THROW(ParseInteger("--max-side", "0.5"), InvalidRequestError);
}

TEST(CliArgsTests, ParseInteger_OutOfIntRange_ThrowsInvalidRequest) {
  EXPECT_THROW(ParseInteger("--ink-threshold", "1e12"), InvalidRequestError);
  EXPECT_THROW(ParseInteger("--max-side", "-1e12"), InvalidRequestError);
  EXPECT_EQ(ParseInteger("--steps", std::to_string(std::numeric_limits<int>::max())),
            std::numeric_limits<int>::max());
}

TEST(CliArgsTests, ParseSeed_RejectsSignsAndText) {
  EXPECT_EQ(ParseSeed("--seed", "1234"), 1234u);
  EXPECT_EQ(ParseSeed("--seed", "18446744073709551615"), std::numeric_limits<uint64_t>::max());
  EXPECT_THROW(ParseSeed("--seed", "-5"), InvalidRequestError);
  EXPECT_THROW(ParseSeed("--seed", "12ab"), InvalidRequestError);
  EXPECT_THROW(ParseSeed("--seed", "18446744073709551616"), InvalidRequestError);
}
};  // namespace mangatint

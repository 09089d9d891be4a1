// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <stout/hashset.hpp>

#include <conductor/plan/status.hpp>
#include <conductor/plan/step.hpp>
#include <conductor/plan/strategy.hpp>

#include "tests/mock.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::ParallelStrategy;
using conductor::plan::SerialStrategy;
using conductor::plan::Status;
using conductor::plan::Step;

namespace conductor {
namespace internal {
namespace tests {

class StrategyTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    step0.reset(new TestStep("step-0", Status::PENDING, string("asset-0")));
    step1.reset(new TestStep("step-1", Status::PENDING, string("asset-1")));
    step2.reset(new TestStep("step-2", Status::PENDING, string("asset-2")));

    steps = {step0, step1, step2};
  }

  shared_ptr<TestStep> step0;
  shared_ptr<TestStep> step1;
  shared_ptr<TestStep> step2;

  vector<shared_ptr<Step>> steps;
};


TEST_F(StrategyTest, SerialReturnsFirstIncomplete)
{
  SerialStrategy<Step> strategy;

  vector<shared_ptr<Step>> candidates =
    strategy.getCandidates(steps, hashset<string>());

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);

  step0->setStatus(Status::COMPLETE);

  candidates = strategy.getCandidates(steps, hashset<string>());

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step1, candidates[0]);
}


TEST_F(StrategyTest, SerialReturnsStartedStep)
{
  SerialStrategy<Step> strategy;

  // A step which is already under way is still the candidate: later
  // steps wait until it completes.
  step0->setStatus(Status::STARTING);

  vector<shared_ptr<Step>> candidates =
    strategy.getCandidates(steps, hashset<string>());

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
}


TEST_F(StrategyTest, SerialBlocksOnDirtyAsset)
{
  SerialStrategy<Step> strategy;

  vector<shared_ptr<Step>> candidates =
    strategy.getCandidates(steps, {"asset-0"});

  EXPECT_TRUE(candidates.empty());

  candidates = strategy.getCandidates(steps, {"asset-1"});

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
}


TEST_F(StrategyTest, SerialAllComplete)
{
  SerialStrategy<Step> strategy;

  step0->setStatus(Status::COMPLETE);
  step1->setStatus(Status::COMPLETE);
  step2->setStatus(Status::COMPLETE);

  EXPECT_TRUE(strategy.getCandidates(steps, hashset<string>()).empty());
}


TEST_F(StrategyTest, ParallelReturnsAllIncomplete)
{
  ParallelStrategy<Step> strategy;

  step1->setStatus(Status::COMPLETE);

  vector<shared_ptr<Step>> candidates =
    strategy.getCandidates(steps, hashset<string>());

  ASSERT_EQ(2u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
  EXPECT_EQ(step2, candidates[1]);
}


TEST_F(StrategyTest, ParallelSkipsDirtyAssets)
{
  ParallelStrategy<Step> strategy;

  vector<shared_ptr<Step>> candidates =
    strategy.getCandidates(steps, {"asset-0", "asset-2"});

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step1, candidates[0]);
}


TEST_F(StrategyTest, Interrupt)
{
  SerialStrategy<Step> serial;
  ParallelStrategy<Step> parallel;

  EXPECT_FALSE(serial.isInterrupted());

  // Only the first call changes the flag.
  EXPECT_TRUE(serial.interrupt());
  EXPECT_FALSE(serial.interrupt());
  EXPECT_TRUE(serial.isInterrupted());

  EXPECT_TRUE(parallel.interrupt());

  EXPECT_TRUE(serial.getCandidates(steps, hashset<string>()).empty());
  EXPECT_TRUE(parallel.getCandidates(steps, hashset<string>()).empty());

  // Interrupting the strategy leaves the children untouched.
  EXPECT_FALSE(step0->isInterrupted());

  EXPECT_TRUE(serial.proceed());
  EXPECT_FALSE(serial.proceed());
  EXPECT_FALSE(serial.isInterrupted());

  EXPECT_EQ(1u, serial.getCandidates(steps, hashset<string>()).size());
}


TEST_F(StrategyTest, Name)
{
  EXPECT_EQ("serial", SerialStrategy<Step>().getName());
  EXPECT_EQ("parallel", ParallelStrategy<Step>().getName());
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {

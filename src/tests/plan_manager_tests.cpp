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

#include <process/owned.hpp>

#include <stout/hashset.hpp>

#include <conductor/plan/phase.hpp>
#include <conductor/plan/plan.hpp>
#include <conductor/plan/plan_coordinator.hpp>
#include <conductor/plan/plan_manager.hpp>
#include <conductor/plan/status.hpp>
#include <conductor/plan/step.hpp>
#include <conductor/plan/strategy.hpp>

#include "tests/mock.hpp"

using process::Owned;

using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::DefaultPlanManager;
using conductor::plan::ParallelStrategy;
using conductor::plan::Phase;
using conductor::plan::Plan;
using conductor::plan::PlanCoordinator;
using conductor::plan::PlanManager;
using conductor::plan::Status;
using conductor::plan::Step;
using conductor::plan::Strategy;

namespace conductor {
namespace internal {
namespace tests {

static shared_ptr<Phase> createParallelPhase(
    const string& name,
    const vector<shared_ptr<Step>>& steps)
{
  return std::make_shared<Phase>(
      name,
      steps,
      Owned<Strategy<Step>>(new ParallelStrategy<Step>()));
}


TEST(PlanManagerTest, InterruptedUntilProceed)
{
  shared_ptr<TestStep> step(new TestStep("step"));

  shared_ptr<Plan> plan = std::make_shared<Plan>(
      "deploy",
      vector<shared_ptr<Phase>>{std::make_shared<Phase>(
          "phase", vector<shared_ptr<Step>>{step})});

  DefaultPlanManager manager(plan);

  EXPECT_EQ(plan, manager.getPlan());
  EXPECT_TRUE(plan->isInterrupted());
  EXPECT_EQ(Status::WAITING, plan->getStatus());
  EXPECT_TRUE(manager.getCandidates(hashset<string>()).empty());

  plan->proceed();

  vector<shared_ptr<Step>> candidates =
    manager.getCandidates(hashset<string>());

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step, candidates[0]);
}


TEST(PlanManagerTest, SkipsInterruptedPhasesAndSteps)
{
  shared_ptr<TestStep> step0(new TestStep("step-0"));
  shared_ptr<TestStep> step1(new TestStep("step-1"));
  shared_ptr<TestStep> step2(new TestStep("step-2"));

  shared_ptr<Phase> phase0 = createParallelPhase("phase-0", {step0, step1});
  shared_ptr<Phase> phase1 = createParallelPhase("phase-1", {step2});

  shared_ptr<Plan> plan = std::make_shared<Plan>(
      "deploy",
      vector<shared_ptr<Phase>>{phase0, phase1},
      Owned<Strategy<Phase>>(new ParallelStrategy<Phase>()));

  DefaultPlanManager manager(plan);
  plan->proceed();

  EXPECT_EQ(3u, manager.getCandidates(hashset<string>()).size());

  step1->interrupt();

  vector<shared_ptr<Step>> candidates =
    manager.getCandidates(hashset<string>());

  ASSERT_EQ(2u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
  EXPECT_EQ(step2, candidates[1]);

  phase0->interrupt();

  candidates = manager.getCandidates(hashset<string>());

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step2, candidates[0]);
}


TEST(PlanManagerTest, SkipsDirtyAssets)
{
  shared_ptr<TestStep> step0(
      new TestStep("step-0", Status::PENDING, string("pod-0")));
  shared_ptr<TestStep> step1(
      new TestStep("step-1", Status::PENDING, string("pod-1")));

  shared_ptr<Plan> plan = std::make_shared<Plan>(
      "deploy",
      vector<shared_ptr<Phase>>{
        createParallelPhase("phase", {step0, step1})});

  DefaultPlanManager manager(plan);
  plan->proceed();

  vector<shared_ptr<Step>> candidates = manager.getCandidates({"pod-0"});

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step1, candidates[0]);
}


TEST(PlanManagerTest, DirtyAssets)
{
  shared_ptr<TestStep> pending(
      new TestStep("pending", Status::PENDING, string("pod-0")));
  shared_ptr<TestStep> prepared(
      new TestStep("prepared", Status::PREPARED, string("pod-1")));
  shared_ptr<TestStep> starting(
      new TestStep("starting", Status::STARTING, string("pod-2")));
  shared_ptr<TestStep> inProgress(
      new TestStep("in-progress", Status::IN_PROGRESS, string("pod-3")));
  shared_ptr<TestStep> complete(
      new TestStep("complete", Status::COMPLETE, string("pod-4")));
  shared_ptr<TestStep> anonymous(
      new TestStep("anonymous", Status::STARTING));

  shared_ptr<Plan> plan = std::make_shared<Plan>(
      "deploy",
      vector<shared_ptr<Phase>>{createParallelPhase(
          "phase",
          {pending, prepared, starting, inProgress, complete, anonymous})});

  DefaultPlanManager manager(plan);

  const hashset<string> dirtyAssets = manager.getDirtyAssets();

  EXPECT_EQ(3u, dirtyAssets.size());
  EXPECT_TRUE(dirtyAssets.contains("pod-1"));
  EXPECT_TRUE(dirtyAssets.contains("pod-2"));
  EXPECT_TRUE(dirtyAssets.contains("pod-3"));
}


class PlanCoordinatorTest : public ::testing::Test
{
protected:
  shared_ptr<PlanManager> createManager(
      const string& name,
      const vector<shared_ptr<Step>>& steps)
  {
    shared_ptr<Plan> plan = std::make_shared<Plan>(
        name,
        vector<shared_ptr<Phase>>{createParallelPhase("phase", steps)});

    shared_ptr<PlanManager> manager =
      std::make_shared<DefaultPlanManager>(plan);

    plan->proceed();

    return manager;
  }
};


TEST_F(PlanCoordinatorTest, DisjointAssets)
{
  shared_ptr<TestStep> step0(
      new TestStep("step-0", Status::PENDING, string("pod-0")));
  shared_ptr<TestStep> step1(
      new TestStep("step-1", Status::PENDING, string("pod-1")));

  PlanCoordinator coordinator({
      createManager("deploy", {step0}),
      createManager("recovery", {step1})});

  vector<shared_ptr<Step>> candidates = coordinator.getCandidates();

  ASSERT_EQ(2u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
  EXPECT_EQ(step1, candidates[1]);
}


TEST_F(PlanCoordinatorTest, SameAssetWithinCycle)
{
  shared_ptr<TestStep> step0(
      new TestStep("step-0", Status::PENDING, string("pod-0")));
  shared_ptr<TestStep> step1(
      new TestStep("step-1", Status::PENDING, string("pod-0")));

  PlanCoordinator coordinator({
      createManager("deploy", {step0}),
      createManager("recovery", {step1})});

  // The first plan claims the asset.
  vector<shared_ptr<Step>> candidates = coordinator.getCandidates();

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);
}


TEST_F(PlanCoordinatorTest, AssetDirtyInOtherPlan)
{
  shared_ptr<TestStep> step0(
      new TestStep("step-0", Status::STARTING, string("pod-0")));
  shared_ptr<TestStep> step1(
      new TestStep("step-1", Status::PENDING, string("pod-0")));

  PlanCoordinator coordinator({
      createManager("deploy", {step0}),
      createManager("recovery", {step1})});

  // The first plan still works on the asset.
  vector<shared_ptr<Step>> candidates = coordinator.getCandidates();

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step0, candidates[0]);

  step0->setStatus(Status::COMPLETE);

  candidates = coordinator.getCandidates();

  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(step1, candidates[0]);
}


TEST_F(PlanCoordinatorTest, StepsWithoutAsset)
{
  shared_ptr<TestStep> step0(new TestStep("step-0"));
  shared_ptr<TestStep> step1(new TestStep("step-1"));

  PlanCoordinator coordinator({
      createManager("deploy", {step0}),
      createManager("recovery", {step1})});

  EXPECT_EQ(2u, coordinator.getCandidates().size());
  EXPECT_EQ(2u, coordinator.getPlanManagers().size());
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {

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

#include <gmock/gmock.h>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>
#include <mesos/type_utils.hpp>

#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include <conductor/plan/phase.hpp>
#include <conductor/plan/plan.hpp>
#include <conductor/plan/status.hpp>

#include "scheduler/deploy.hpp"
#include "scheduler/launch_step.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

#include "tests/mock.hpp"
#include "tests/utils.hpp"

using mesos::Offer;
using mesos::Resources;
using mesos::TaskID;
using mesos::TaskInfo;

using std::shared_ptr;
using std::string;
using std::vector;

using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SaveArg;

using conductor::plan::Phase;
using conductor::plan::Plan;
using conductor::plan::Status;

using conductor::internal::scheduler::FileStateStore;
using conductor::internal::scheduler::LaunchStep;
using conductor::internal::scheduler::OfferPool;

namespace conductor {
namespace internal {
namespace tests {

class LaunchStepTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    stateStore.reset(new FileStateStore(path::join(os::getcwd(), "state")));
    offerPool.reset(new OfferPool(&driver));

    resources = Resources::parse("cpus:0.1;mem:32").get();
    offered = Resources::parse("cpus:1;mem:128").get();
  }

  shared_ptr<LaunchStep> createStep(const string& podInstance = "pod-0")
  {
    return std::make_shared<LaunchStep>(
        podInstance,
        "echo hello",
        resources,
        stateStore.get(),
        offerPool.get());
  }

  testing::NiceMock<MockDriverHandle> driver;
  std::unique_ptr<FileStateStore> stateStore;
  std::unique_ptr<OfferPool> offerPool;
  Resources resources;
  Resources offered;
};


TEST_F(LaunchStepTest, Launch)
{
  shared_ptr<LaunchStep> step = createStep();

  EXPECT_EQ("pod-0-task", step->getName());
  EXPECT_EQ("LaunchStep", step->getType());
  EXPECT_SOME_EQ("pod-0", step->getAsset());
  EXPECT_NONE(step->getTaskId());

  step->updateParameters({{"LOG_LEVEL", "DEBUG"}});

  offerPool->add({createOffer("offer-0", offered)});

  step->start();

  EXPECT_EQ(Status::STARTING, step->getStatus());
  ASSERT_SOME(step->getTaskId());

  // The task is checkpointed before it is launched.
  Result<TaskInfo> task = stateStore->fetchTask("pod-0-task");
  ASSERT_SOME(task);
  EXPECT_EQ(step->getTaskId().get(), task->task_id());
  EXPECT_EQ("echo hello", task->command().value());

  ASSERT_EQ(1, task->command().environment().variables_size());
  EXPECT_EQ("LOG_LEVEL", task->command().environment().variables(0).name());
  EXPECT_EQ("DEBUG", task->command().environment().variables(0).value());

  vector<Offer::Operation> operations;
  EXPECT_CALL(driver, acceptOffers(_, _, _))
    .WillOnce(DoAll(SaveArg<1>(&operations), Return(Nothing())));

  ASSERT_SOME(offerPool->flush());

  ASSERT_EQ(1u, operations.size());
  EXPECT_EQ(Offer::Operation::LAUNCH, operations[0].type());

  // A step which already started is not launched again.
  offerPool->add({createOffer("offer-1", offered)});

  step->start();

  EXPECT_CALL(driver, declineOffer(_, _))
    .WillOnce(Return(Nothing()));

  ASSERT_SOME(offerPool->flush());
}


TEST_F(LaunchStepTest, NoOffer)
{
  shared_ptr<LaunchStep> step = createStep();

  step->start();

  EXPECT_EQ(Status::PREPARED, step->getStatus());
  EXPECT_NONE(step->getTaskId());

  offerPool->add({createOffer("offer-0", offered)});

  step->start();

  EXPECT_EQ(Status::STARTING, step->getStatus());
}


TEST_F(LaunchStepTest, TaskStatusUpdates)
{
  shared_ptr<LaunchStep> step = createStep();

  offerPool->add({createOffer("offer-0", offered)});
  step->start();

  ASSERT_SOME(step->getTaskId());
  const TaskID taskId = step->getTaskId().get();

  // Updates of other tasks are ignored.
  TaskID other;
  other.set_value("pod-1-task__0");
  step->update(createTaskStatus(other, mesos::TASK_RUNNING));
  EXPECT_EQ(Status::STARTING, step->getStatus());

  step->update(createTaskStatus(taskId, mesos::TASK_STAGING));
  EXPECT_EQ(Status::STARTING, step->getStatus());

  step->update(createTaskStatus(taskId, mesos::TASK_RUNNING));
  EXPECT_EQ(Status::COMPLETE, step->getStatus());

  // A failed task is launched again.
  step->update(createTaskStatus(taskId, mesos::TASK_FAILED));
  EXPECT_EQ(Status::PENDING, step->getStatus());
  EXPECT_TRUE(step->getErrors().empty());
}


TEST_F(LaunchStepTest, TaskError)
{
  shared_ptr<LaunchStep> step = createStep();

  offerPool->add({createOffer("offer-0", offered)});
  step->start();

  ASSERT_SOME(step->getTaskId());

  step->update(createTaskStatus(
      step->getTaskId().get(),
      mesos::TASK_ERROR,
      "Invalid task"));

  EXPECT_EQ(Status::ERROR, step->getStatus());
  ASSERT_EQ(1u, step->getErrors().size());
}


TEST_F(LaunchStepTest, RestartAfterTaskError)
{
  shared_ptr<LaunchStep> step = createStep();
  Phase phase("pods", {step});

  offerPool->add({createOffer("offer-0", offered)});
  step->start();
  ASSERT_SOME(offerPool->flush());

  ASSERT_SOME(step->getTaskId());
  const TaskID failed = step->getTaskId().get();

  step->update(createTaskStatus(failed, mesos::TASK_ERROR, "Invalid task"));
  EXPECT_EQ(Status::ERROR, phase.getStatus());

  phase.restart();

  EXPECT_EQ(Status::PENDING, step->getStatus());
  EXPECT_TRUE(step->getErrors().empty());
  EXPECT_EQ(Status::PENDING, phase.getStatus());

  // The next offer cycle launches a new task.
  offerPool->add({createOffer("offer-1", offered)});
  step->start();
  ASSERT_SOME(offerPool->flush());

  ASSERT_SOME(step->getTaskId());
  EXPECT_NE(failed.value(), step->getTaskId()->value());

  step->update(createTaskStatus(
      step->getTaskId().get(),
      mesos::TASK_RUNNING));

  EXPECT_EQ(Status::COMPLETE, step->getStatus());
  EXPECT_TRUE(step->getErrors().empty());
  EXPECT_TRUE(phase.getErrors().empty());
  EXPECT_EQ(Status::COMPLETE, phase.getStatus());
}


TEST_F(LaunchStepTest, Recover)
{
  TaskInfo task = createTask("pod-0-task");
  ASSERT_SOME(stateStore->storeTasks({task}));
  ASSERT_SOME(stateStore->storeStatus(
      createTaskStatus(task.task_id(), mesos::TASK_RUNNING)));

  shared_ptr<LaunchStep> step = createStep();

  EXPECT_EQ(Status::COMPLETE, step->getStatus());
  EXPECT_SOME_EQ(task.task_id(), step->getTaskId());

  // A pod whose task is not running is deployed again.
  TaskInfo failed = createTask("pod-1-task");
  ASSERT_SOME(stateStore->storeTasks({failed}));
  ASSERT_SOME(stateStore->storeStatus(
      createTaskStatus(failed.task_id(), mesos::TASK_FAILED)));

  EXPECT_EQ(Status::PENDING, createStep("pod-1")->getStatus());
}


TEST_F(LaunchStepTest, BuildDeployPlan)
{
  Try<shared_ptr<Plan>> plan = scheduler::buildDeployPlan(
      2,
      "echo hello",
      "cpus:0.1;mem:32",
      "parallel",
      stateStore.get(),
      offerPool.get());

  ASSERT_SOME(plan);

  EXPECT_EQ("deploy", plan.get()->getName());
  ASSERT_EQ(1u, plan.get()->getChildren().size());

  const shared_ptr<Phase>& phase = plan.get()->getChildren()[0];
  EXPECT_EQ("pods", phase->getName());
  EXPECT_EQ("parallel", phase->getStrategy().getName());

  ASSERT_EQ(2u, phase->getChildren().size());
  EXPECT_EQ("pod-0-task", phase->getChildren()[0]->getName());
  EXPECT_EQ("pod-1-task", phase->getChildren()[1]->getName());

  EXPECT_ERROR(scheduler::buildDeployPlan(
      -1, "echo", "cpus:1", "serial", stateStore.get(), offerPool.get()));

  EXPECT_ERROR(scheduler::buildDeployPlan(
      1, "echo", "cpus:one", "serial", stateStore.get(), offerPool.get()));

  EXPECT_ERROR(scheduler::buildDeployPlan(
      1, "echo", "cpus:1", "random", stateStore.get(), offerPool.get()));
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {

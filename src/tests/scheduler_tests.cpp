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

#include <glog/logging.h>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>
#include <mesos/type_utils.hpp>

#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include <conductor/plan/plan.hpp>
#include <conductor/plan/plan_coordinator.hpp>
#include <conductor/plan/plan_manager.hpp>
#include <conductor/plan/status.hpp>

#include "scheduler/deploy.hpp"
#include "scheduler/driver.hpp"
#include "scheduler/launch_step.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/scheduler.hpp"
#include "scheduler/state_store.hpp"

#include "tests/mock.hpp"
#include "tests/utils.hpp"

using mesos::FrameworkID;
using mesos::Offer;
using mesos::OfferID;
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

using conductor::plan::DefaultPlanManager;
using conductor::plan::Plan;
using conductor::plan::PlanCoordinator;
using conductor::plan::PlanManager;
using conductor::plan::Status;

using conductor::internal::scheduler::FileStateStore;
using conductor::internal::scheduler::LaunchStep;
using conductor::internal::scheduler::MesosDriverHandle;
using conductor::internal::scheduler::OfferPool;
using conductor::internal::scheduler::PlanScheduler;

namespace conductor {
namespace internal {
namespace tests {

class PlanSchedulerTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    stateStore.reset(new FileStateStore(path::join(os::getcwd(), "state")));
    offerPool.reset(new OfferPool(&driver));

    Try<shared_ptr<Plan>> deploy = scheduler::buildDeployPlan(
        1,
        "echo hello",
        "cpus:0.1;mem:32",
        "serial",
        stateStore.get(),
        offerPool.get());

    ASSERT_SOME(deploy);
    plan = deploy.get();

    coordinator.reset(new PlanCoordinator(
        {std::make_shared<DefaultPlanManager>(plan)}));

    planScheduler.reset(new PlanScheduler(
        stateStore.get(),
        &driverHandle,
        offerPool.get(),
        coordinator.get()));

    frameworkId.set_value("framework-1");
  }

  vector<Offer> offers()
  {
    return {createOffer("offer-0", Resources::parse("cpus:1;mem:128").get())};
  }

  // Returns the task id of the only step of the deploy plan.
  Option<TaskID> getTaskId()
  {
    const shared_ptr<LaunchStep> step =
      std::dynamic_pointer_cast<LaunchStep>(
          plan->getChildren()[0]->getChildren()[0]);

    CHECK_NOTNULL(step.get());

    return step->getTaskId();
  }

  testing::NiceMock<MockDriverHandle> driver;
  MesosDriverHandle driverHandle;

  std::unique_ptr<FileStateStore> stateStore;
  std::unique_ptr<OfferPool> offerPool;
  shared_ptr<Plan> plan;
  std::unique_ptr<PlanCoordinator> coordinator;
  std::unique_ptr<PlanScheduler> planScheduler;

  FrameworkID frameworkId;
};


TEST_F(PlanSchedulerTest, OffersDeclinedUntilRegistered)
{
  EXPECT_CALL(driver, declineOffer(_, _))
    .WillOnce(Return(Nothing()));

  EXPECT_CALL(driver, acceptOffers(_, _, _))
    .Times(0);

  planScheduler->processOffers(offers());

  EXPECT_EQ(Status::WAITING, plan->getStatus());
  EXPECT_EQ(0u, offerPool->size());
}


TEST_F(PlanSchedulerTest, Initialize)
{
  planScheduler->initialize(frameworkId);

  EXPECT_SOME_EQ(frameworkId, stateStore->fetchFrameworkId());
  EXPECT_FALSE(plan->isInterrupted());
  EXPECT_EQ(Status::PENDING, plan->getStatus());
}


TEST_F(PlanSchedulerTest, Deploy)
{
  planScheduler->initialize(frameworkId);

  vector<OfferID> accepted;
  EXPECT_CALL(driver, acceptOffers(_, _, _))
    .WillOnce(DoAll(SaveArg<0>(&accepted), Return(Nothing())));

  planScheduler->processOffers(offers());

  ASSERT_EQ(1u, accepted.size());
  EXPECT_EQ("offer-0", accepted[0].value());

  EXPECT_EQ(Status::STARTING, plan->getStatus());

  Option<TaskID> taskId = getTaskId();
  ASSERT_SOME(taskId);

  planScheduler->processStatus(
      createTaskStatus(taskId.get(), mesos::TASK_RUNNING));

  EXPECT_TRUE(plan->isComplete());
  EXPECT_SOME(stateStore->fetchStatus("pod-0-task"));

  // Nothing is left to do with further offers.
  EXPECT_CALL(driver, declineOffer(_, _))
    .WillOnce(Return(Nothing()));

  planScheduler->processOffers(offers());
}


TEST_F(PlanSchedulerTest, FailedTaskIsRelaunched)
{
  planScheduler->initialize(frameworkId);

  planScheduler->processOffers(offers());

  Option<TaskID> taskId = getTaskId();
  ASSERT_SOME(taskId);

  planScheduler->processStatus(
      createTaskStatus(taskId.get(), mesos::TASK_FAILED));

  EXPECT_EQ(Status::PENDING, plan->getStatus());

  planScheduler->processOffers(offers());

  ASSERT_SOME(getTaskId());
  EXPECT_NE(taskId->value(), getTaskId()->value());
  EXPECT_EQ(Status::STARTING, plan->getStatus());
}


TEST_F(PlanSchedulerTest, UnknownTaskStatus)
{
  planScheduler->initialize(frameworkId);

  TaskID taskId;
  taskId.set_value("pod-9-task__0");

  // The status can't be stored but still reaches the plans.
  planScheduler->processStatus(createTaskStatus(taskId, mesos::TASK_RUNNING));

  EXPECT_EQ(Status::PENDING, plan->getStatus());
}


TEST_F(PlanSchedulerTest, OfferRescinded)
{
  offerPool->add(offers());

  OfferID offerId;
  offerId.set_value("offer-0");

  planScheduler->offerRescinded(nullptr, offerId);

  EXPECT_EQ(0u, offerPool->size());
}


TEST(MesosDriverHandleTest, NoDriver)
{
  MesosDriverHandle handle;

  TaskID taskId;
  taskId.set_value("pod-0-task__0");

  EXPECT_ERROR(handle.killTask(taskId));
  EXPECT_ERROR(handle.stop(false));
  EXPECT_ERROR(handle.declineOffer(OfferID(), mesos::Filters()));
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {

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

#include "scheduler/scheduler.hpp"

#include <memory>

#include <glog/logging.h>

#include <mesos/type_utils.hpp>

#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <conductor/plan/plan.hpp>
#include <conductor/plan/plan_manager.hpp>
#include <conductor/plan/step.hpp>

using mesos::ExecutorID;
using mesos::FrameworkID;
using mesos::MasterInfo;
using mesos::Offer;
using mesos::OfferID;
using mesos::SchedulerDriver;
using mesos::SlaveID;
using mesos::TaskStatus;

using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::PlanCoordinator;
using conductor::plan::PlanManager;
using conductor::plan::Step;

namespace conductor {
namespace internal {
namespace scheduler {

PlanScheduler::PlanScheduler(
    StateStore* _stateStore,
    MesosDriverHandle* _driver,
    OfferPool* _offerPool,
    PlanCoordinator* _coordinator)
  : stateStore(CHECK_NOTNULL(_stateStore)),
    driver(CHECK_NOTNULL(_driver)),
    offerPool(CHECK_NOTNULL(_offerPool)),
    coordinator(CHECK_NOTNULL(_coordinator)) {}


void PlanScheduler::registered(
    SchedulerDriver* _driver,
    const FrameworkID& frameworkId,
    const MasterInfo& masterInfo)
{
  LOG(INFO) << "Registered with master " << masterInfo.id()
            << " and got framework ID " << frameworkId;

  driver->setDriver(_driver);

  initialize(frameworkId);
}


void PlanScheduler::reregistered(
    SchedulerDriver* _driver,
    const MasterInfo& masterInfo)
{
  LOG(INFO) << "Reregistered with master " << masterInfo.id();

  driver->setDriver(_driver);
}


void PlanScheduler::disconnected(SchedulerDriver* _driver)
{
  LOG(INFO) << "Disconnected!";
}


void PlanScheduler::resourceOffers(
    SchedulerDriver* _driver,
    const vector<Offer>& offers)
{
  processOffers(offers);
}


void PlanScheduler::offerRescinded(
    SchedulerDriver* _driver,
    const OfferID& offerId)
{
  LOG(INFO) << "Offer " << offerId << " has been rescinded";

  offerPool->rescind(offerId);
}


void PlanScheduler::statusUpdate(
    SchedulerDriver* _driver,
    const TaskStatus& status)
{
  processStatus(status);
}


void PlanScheduler::frameworkMessage(
    SchedulerDriver* _driver,
    const ExecutorID& executorId,
    const SlaveID& slaveId,
    const string& data)
{
  LOG(WARNING) << "Ignoring framework message from executor '" << executorId
               << "' on agent " << slaveId;
}


void PlanScheduler::slaveLost(SchedulerDriver* _driver, const SlaveID& slaveId)
{
  LOG(INFO) << "Lost agent " << slaveId;
}


void PlanScheduler::executorLost(
    SchedulerDriver* _driver,
    const ExecutorID& executorId,
    const SlaveID& slaveId,
    int status)
{
  LOG(INFO) << "Lost executor '" << executorId << "' on agent "
            << slaveId << " with status " << status;
}


void PlanScheduler::error(SchedulerDriver* _driver, const string& message)
{
  LOG(ERROR) << "Scheduler error: " << message;
}


void PlanScheduler::initialize(const FrameworkID& frameworkId)
{
  Try<Nothing> stored = stateStore->storeFrameworkId(frameworkId);
  if (stored.isError()) {
    LOG(ERROR) << "Failed to store framework ID " << frameworkId << ": "
               << stored.error();
  }

  foreach (const shared_ptr<PlanManager>& planManager,
           coordinator->getPlanManagers()) {
    LOG(INFO) << "Proceeding with plan '"
              << planManager->getPlan()->getName() << "'";

    planManager->getPlan()->proceed();
  }
}


void PlanScheduler::processOffers(const vector<Offer>& offers)
{
  offerPool->add(offers);

  const vector<shared_ptr<Step>> candidates = coordinator->getCandidates();

  if (!candidates.empty()) {
    vector<string> names;
    foreach (const shared_ptr<Step>& step, candidates) {
      names.push_back(step->getName());
    }

    LOG(INFO) << "Starting candidate steps " << stringify(names)
              << " with " << offers.size() << " offer(s)";
  }

  foreach (const shared_ptr<Step>& step, candidates) {
    step->start();
  }

  Try<Nothing> flush = offerPool->flush();
  if (flush.isError()) {
    LOG(WARNING) << "Failed to respond to offers: " << flush.error();
  }
}


void PlanScheduler::processStatus(const TaskStatus& status)
{
  LOG(INFO) << "Task '" << status.task_id() << "' is in state "
            << status.state()
            << (status.has_message()
                ? " with message '" + status.message() + "'"
                : "");

  Try<Nothing> stored = stateStore->storeStatus(status);
  if (stored.isError()) {
    LOG(WARNING) << "Failed to store status of task '" << status.task_id()
                 << "': " << stored.error();
  }

  foreach (const shared_ptr<PlanManager>& planManager,
           coordinator->getPlanManagers()) {
    planManager->getPlan()->update(status);
  }
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

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

#include "uninstall/plan_builder.hpp"

#include <vector>

#include <glog/logging.h>

#include <mesos/mesos.hpp>
#include <mesos/type_utils.hpp>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>

#include <conductor/plan/phase.hpp>
#include <conductor/plan/step.hpp>
#include <conductor/plan/strategy.hpp>

#include "api/plans.hpp"

#include "scheduler/constants.hpp"
#include "scheduler/resource_utils.hpp"

#include "uninstall/steps.hpp"

using mesos::FrameworkID;
using mesos::TaskID;
using mesos::TaskInfo;
using mesos::TaskStatus;

using process::Owned;

using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::ParallelStrategy;
using conductor::plan::Phase;
using conductor::plan::Plan;
using conductor::plan::SerialStrategy;
using conductor::plan::Status;
using conductor::plan::Step;

using conductor::internal::scheduler::DriverHandle;
using conductor::internal::scheduler::OfferPool;
using conductor::internal::scheduler::StateStore;

namespace conductor {
namespace internal {
namespace uninstall {

Try<shared_ptr<Plan>> buildUninstallPlan(
    StateStore* stateStore,
    DriverHandle* driver,
    OfferPool* offerPool,
    const Option<SecretsClient*>& secrets,
    const string& secretsNamespace)
{
  Result<FrameworkID> frameworkId = stateStore->fetchFrameworkId();
  if (frameworkId.isError()) {
    return Error("Failed to fetch framework ID: " + frameworkId.error());
  }

  if (frameworkId.isNone()) {
    LOG(INFO) << "Framework ID is unset. Clearing state data and using an "
              << "empty completed plan";

    Try<Nothing> clear = stateStore->clearAllData();
    if (clear.isError()) {
      return Error("Failed to clear state: " + clear.error());
    }

    return std::make_shared<Plan>(
        api::DEPLOY_PLAN_NAME,
        vector<shared_ptr<Phase>>());
  }

  Try<vector<TaskInfo>> tasks = stateStore->fetchTasks();
  if (tasks.isError()) {
    return Error("Failed to fetch tasks: " + tasks.error());
  }

  Try<vector<TaskStatus>> statuses = stateStore->fetchStatuses();
  if (statuses.isError()) {
    return Error("Failed to fetch task statuses: " + statuses.error());
  }

  hashset<TaskID> terminated;
  hashset<TaskID> errored;
  foreach (const TaskStatus& status, statuses.get()) {
    if (scheduler::isTerminalState(status.state())) {
      terminated.insert(status.task_id());
    }

    if (status.state() == mesos::TASK_ERROR) {
      errored.insert(status.task_id());
    }
  }

  vector<shared_ptr<Phase>> phases;

  // Kill all tasks first so that their resources may be released.
  vector<shared_ptr<Step>> killSteps;
  foreach (const TaskInfo& task, tasks.get()) {
    killSteps.push_back(std::make_shared<TaskKillStep>(
        task.task_id(),
        driver,
        terminated.contains(task.task_id())
          ? Status::COMPLETE
          : Status::PENDING));
  }

  phases.push_back(std::make_shared<Phase>(
      KILL_TASKS_PHASE_NAME,
      killSteps,
      Owned<plan::Strategy<Step>>(new ParallelStrategy<Step>())));

  // A task which failed to launch never reserved anything.
  vector<TaskInfo> reserving;
  foreach (const TaskInfo& task, tasks.get()) {
    if (scheduler::isPermanentlyFailed(task) &&
        errored.contains(task.task_id())) {
      continue;
    }

    reserving.push_back(task);
  }

  // Executor resources are shared by several tasks: one step per
  // unique resource id.
  vector<shared_ptr<Step>> resourceSteps;
  size_t released = 0;
  foreach (const string& resourceId, scheduler::getResourceIds(reserving)) {
    const bool tombstone =
      strings::startsWith(resourceId, scheduler::TOMBSTONE_PREFIX);

    if (tombstone) {
      released++;
    }

    resourceSteps.push_back(std::make_shared<ResourceCleanupStep>(
        resourceId,
        offerPool,
        tombstone ? Status::COMPLETE : Status::PENDING));
  }

  LOG(INFO) << "Configuring resource cleanup of " << reserving.size()
            << " task(s): " << released << "/" << resourceSteps.size()
            << " expected resources have been unreserved";

  phases.push_back(std::make_shared<Phase>(
      RESOURCE_PHASE_NAME,
      resourceSteps,
      Owned<plan::Strategy<Step>>(new ParallelStrategy<Step>())));

  if (secrets.isSome()) {
    phases.push_back(std::make_shared<Phase>(
        TLS_CLEANUP_PHASE_NAME,
        vector<shared_ptr<Step>>{
          std::make_shared<TLSCleanupStep>(secrets.get(), secretsNamespace)},
        Owned<plan::Strategy<Step>>(new SerialStrategy<Step>())));
  }

  phases.push_back(std::make_shared<Phase>(
      DEREGISTER_PHASE_NAME,
      vector<shared_ptr<Step>>{
        std::make_shared<DeregisterStep>(stateStore, driver)},
      Owned<plan::Strategy<Step>>(new SerialStrategy<Step>())));

  return std::make_shared<Plan>(api::DEPLOY_PLAN_NAME, phases);
}

} // namespace uninstall {
} // namespace internal {
} // namespace conductor {

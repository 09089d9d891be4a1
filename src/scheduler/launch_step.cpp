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

#include "scheduler/launch_step.hpp"

#include <glog/logging.h>

#include <mesos/type_utils.hpp>

#include <stout/foreach.hpp>
#include <stout/result.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>

#include "scheduler/resource_utils.hpp"

using mesos::CommandInfo;
using mesos::Environment;
using mesos::Resources;
using mesos::TaskID;
using mesos::TaskInfo;
using mesos::TaskStatus;

using std::map;
using std::string;

using conductor::plan::Status;

namespace conductor {
namespace internal {
namespace scheduler {

LaunchStep::LaunchStep(
    const string& _podInstance,
    const string& _command,
    const Resources& _resources,
    StateStore* _stateStore,
    OfferPool* _offerPool)
  : plan::Step(_podInstance + "-task"),
    podInstance(_podInstance),
    command(_command),
    resources(_resources),
    stateStore(CHECK_NOTNULL(_stateStore)),
    offerPool(CHECK_NOTNULL(_offerPool))
{
  recover();
}


string LaunchStep::getType() const
{
  return "LaunchStep";
}


Option<string> LaunchStep::getAsset() const
{
  return podInstance;
}


void LaunchStep::start()
{
  const Status status = getStatus();
  if (status != Status::PENDING && status != Status::PREPARED) {
    VLOG(1) << "Not launching '" << getName() << "' in status " << status;
    return;
  }

  TaskInfo task;
  task.set_name(getName());
  task.mutable_task_id()->CopyFrom(newTaskId(getName()));
  task.mutable_resources()->CopyFrom(resources);

  CommandInfo* commandInfo = task.mutable_command();
  commandInfo->set_shell(true);
  commandInfo->set_value(command);

  synchronized (mutex) {
    foreachpair (const string& name, const string& value, parameters) {
      Environment::Variable* variable =
        commandInfo->mutable_environment()->add_variables();
      variable->set_name(name);
      variable->set_value(value);
    }
  }

  Option<TaskInfo> launched = offerPool->launch(task);
  if (launched.isNone()) {
    VLOG(1) << "No offer fits the task of '" << getName() << "'";
    setStatus(Status::PREPARED);
    return;
  }

  Try<Nothing> stored = stateStore->storeTasks({launched.get()});
  if (stored.isError()) {
    addError(
        "Failed to store task '" + launched->task_id().value() + "': " +
        stored.error());
    return;
  }

  synchronized (mutex) {
    taskId = launched->task_id();
  }

  setStatus(Status::STARTING);
}


void LaunchStep::update(const TaskStatus& status)
{
  const Option<TaskID> current = getTaskId();
  if (current.isNone() || !(current.get() == status.task_id())) {
    return;
  }

  LOG(INFO) << "Task '" << status.task_id() << "' of step '" << getName()
            << "' is in state " << status.state();

  switch (status.state()) {
    case mesos::TASK_STAGING:
    case mesos::TASK_STARTING:
      setStatus(Status::STARTING);
      break;
    case mesos::TASK_RUNNING:
    case mesos::TASK_FINISHED:
      setStatus(Status::COMPLETE);
      break;
    case mesos::TASK_ERROR:
      addError(
          "Task '" + status.task_id().value() + "' could not be launched: " +
          status.message());
      setStatus(Status::ERROR);
      break;
    default:
      if (isTerminalState(status.state())) {
        // Launched again in one of the next offer cycles.
        setStatus(Status::PENDING);
      }
      break;
  }
}


void LaunchStep::updateParameters(const map<string, string>& _parameters)
{
  synchronized (mutex) {
    foreachpair (const string& name, const string& value, _parameters) {
      parameters[name] = value;
    }
  }
}


Option<TaskID> LaunchStep::getTaskId() const
{
  synchronized (mutex) {
    return taskId;
  }
}


void LaunchStep::recover()
{
  Result<TaskInfo> task = stateStore->fetchTask(getName());
  if (task.isError()) {
    LOG(WARNING) << "Failed to recover task of '" << getName() << "': "
                 << task.error();
    return;
  }

  if (task.isNone()) {
    return;
  }

  synchronized (mutex) {
    taskId = task->task_id();
  }

  Result<TaskStatus> status = stateStore->fetchStatus(getName());
  if (status.isError()) {
    LOG(WARNING) << "Failed to recover status of '" << getName() << "': "
                 << status.error();
    return;
  }

  if (status.isSome() &&
      status->task_id() == task->task_id() &&
      status->state() == mesos::TASK_RUNNING) {
    setStatus(Status::COMPLETE);
  }
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

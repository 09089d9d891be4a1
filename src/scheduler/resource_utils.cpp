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

#include "scheduler/resource_utils.hpp"

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/none.hpp>
#include <stout/uuid.hpp>

#include "scheduler/constants.hpp"

using mesos::Label;
using mesos::Labels;
using mesos::Resource;
using mesos::Resources;
using mesos::TaskID;
using mesos::TaskInfo;

using std::string;
using std::vector;

namespace conductor {
namespace internal {
namespace scheduler {

static Option<string> getLabel(const Labels& labels, const string& key)
{
  foreach (const Label& label, labels.labels()) {
    if (label.key() == key && label.has_value()) {
      return label.value();
    }
  }

  return None();
}


Option<string> getResourceId(const Resource& resource)
{
  if (resource.reservations_size() > 0) {
    const Resource::ReservationInfo& reservation =
      resource.reservations(resource.reservations_size() - 1);

    if (reservation.has_labels()) {
      return getLabel(reservation.labels(), RESOURCE_ID_LABEL);
    }

    return None();
  }

  // Resources in the "pre-reservation-refinement" format.
  if (resource.has_reservation() && resource.reservation().has_labels()) {
    return getLabel(resource.reservation().labels(), RESOURCE_ID_LABEL);
  }

  return None();
}


vector<string> getResourceIds(const vector<TaskInfo>& tasks)
{
  vector<string> resourceIds;
  hashset<string> seen;

  auto add = [&](const Resource& resource) {
    const Option<string> resourceId = getResourceId(resource);
    if (resourceId.isSome() && !seen.contains(resourceId.get())) {
      seen.insert(resourceId.get());
      resourceIds.push_back(resourceId.get());
    }
  };

  foreach (const TaskInfo& task, tasks) {
    foreach (const Resource& resource, task.resources()) {
      add(resource);
    }

    if (task.has_executor()) {
      foreach (const Resource& resource, task.executor().resources()) {
        add(resource);
      }
    }
  }

  return resourceIds;
}


Option<Resource> findResource(
    const Resources& resources,
    const string& resourceId)
{
  foreach (const Resource& resource, resources) {
    if (getResourceId(resource) == resourceId) {
      return resource;
    }
  }

  return None();
}


Try<string> getTaskName(const TaskID& taskId)
{
  const string& value = taskId.value();

  size_t index = value.rfind(TASK_NAME_DELIMITER);
  if (index == string::npos || index == 0) {
    return Error(
        "Task id '" + value + "' does not contain a task name followed by '" +
        TASK_NAME_DELIMITER + "'");
  }

  return value.substr(0, index);
}


TaskID newTaskId(const string& taskName)
{
  TaskID taskId;
  taskId.set_value(
      taskName + TASK_NAME_DELIMITER + id::UUID::random().toString());

  return taskId;
}


bool isPermanentlyFailed(const TaskInfo& task)
{
  return task.has_labels() &&
    getLabel(task.labels(), PERMANENTLY_FAILED_LABEL) == string("true");
}


bool isTerminalState(const mesos::TaskState& state)
{
  switch (state) {
    case mesos::TASK_FINISHED:
    case mesos::TASK_FAILED:
    case mesos::TASK_KILLED:
    case mesos::TASK_LOST:
    case mesos::TASK_ERROR:
    case mesos::TASK_DROPPED:
    case mesos::TASK_GONE:
    case mesos::TASK_GONE_BY_OPERATOR:
      return true;
    default:
      return false;
  }
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

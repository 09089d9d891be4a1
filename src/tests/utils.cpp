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

#include "tests/utils.hpp"

#include "scheduler/constants.hpp"

using mesos::Label;
using mesos::Offer;
using mesos::Resource;
using mesos::Resources;
using mesos::TaskID;
using mesos::TaskInfo;
using mesos::TaskState;
using mesos::TaskStatus;

using std::string;

namespace conductor {
namespace internal {
namespace tests {

Offer createOffer(
    const string& offerId,
    const Resources& resources,
    const string& role)
{
  Offer offer;
  offer.mutable_id()->set_value(offerId);
  offer.mutable_framework_id()->set_value("framework");
  offer.mutable_slave_id()->set_value("agent");
  offer.set_hostname("localhost");
  offer.mutable_allocation_info()->set_role(role);

  Resources allocated = resources;
  allocated.allocate(role);
  offer.mutable_resources()->CopyFrom(allocated);

  return offer;
}


TaskStatus createTaskStatus(
    const TaskID& taskId,
    const TaskState& state,
    const string& message)
{
  TaskStatus status;
  status.mutable_task_id()->CopyFrom(taskId);
  status.set_state(state);

  if (!message.empty()) {
    status.set_message(message);
  }

  return status;
}


TaskInfo createTask(const string& name, const Resources& resources)
{
  TaskInfo task;
  task.set_name(name);
  task.mutable_task_id()->set_value(
      name + scheduler::TASK_NAME_DELIMITER + "0");
  task.mutable_slave_id()->set_value("agent");
  task.mutable_resources()->CopyFrom(resources);
  task.mutable_command()->set_value("exit 0");

  return task;
}


Resource createReservedResource(
    const string& name,
    double value,
    const string& role,
    const string& resourceId)
{
  Resource resource;
  resource.set_name(name);
  resource.set_type(mesos::Value::SCALAR);
  resource.mutable_scalar()->set_value(value);

  Resource::ReservationInfo* reservation = resource.add_reservations();
  reservation->set_type(Resource::ReservationInfo::DYNAMIC);
  reservation->set_role(role);

  Label* label = reservation->mutable_labels()->add_labels();
  label->set_key(scheduler::RESOURCE_ID_LABEL);
  label->set_value(resourceId);

  return resource;
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {

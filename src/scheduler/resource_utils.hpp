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

#ifndef __SCHEDULER_RESOURCE_UTILS_HPP__
#define __SCHEDULER_RESOURCE_UTILS_HPP__

#include <string>
#include <vector>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

namespace conductor {
namespace internal {
namespace scheduler {

// Returns the value of the `resource_id` label of the innermost
// reservation of the resource, if it is reserved with one.
Option<std::string> getResourceId(const mesos::Resource& resource);


// Returns the unique resource ids of the resources of the tasks and of
// their executors, in order of first appearance.
std::vector<std::string> getResourceIds(
    const std::vector<mesos::TaskInfo>& tasks);


// Returns a copy of the resource labelled with `resourceId`.
Option<mesos::Resource> findResource(
    const mesos::Resources& resources,
    const std::string& resourceId);


// Returns the task name encoded in a task id of the form
// `<name>__<uuid>`.
Try<std::string> getTaskName(const mesos::TaskID& taskId);


// Generates a unique id for a new task with the given name.
mesos::TaskID newTaskId(const std::string& taskName);


bool isPermanentlyFailed(const mesos::TaskInfo& task);


// Whether a task in this state will never change state again.
bool isTerminalState(const mesos::TaskState& state);

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_RESOURCE_UTILS_HPP__

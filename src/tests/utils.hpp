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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <string>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>

namespace conductor {
namespace internal {
namespace tests {

// Returns an offer of the given resources, allocated to `role`.
mesos::Offer createOffer(
    const std::string& offerId,
    const mesos::Resources& resources,
    const std::string& role = "*");


mesos::TaskStatus createTaskStatus(
    const mesos::TaskID& taskId,
    const mesos::TaskState& state,
    const std::string& message = "");


mesos::TaskInfo createTask(
    const std::string& name,
    const mesos::Resources& resources = mesos::Resources());


// Returns the resource reserved for `role` and labeled with
// `resourceId`, as reserved by a pod of this scheduler.
mesos::Resource createReservedResource(
    const std::string& name,
    double value,
    const std::string& role,
    const std::string& resourceId);

} // namespace tests {
} // namespace internal {
} // namespace conductor {

#endif // __TESTS_UTILS_HPP__

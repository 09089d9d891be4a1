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

#ifndef __SCHEDULER_CONSTANTS_HPP__
#define __SCHEDULER_CONSTANTS_HPP__

#include <stout/duration.hpp>

namespace conductor {
namespace internal {
namespace scheduler {

// How long declined offers are refused by the framework.
constexpr Duration DEFAULT_REFUSE_DURATION = Seconds(5);

// Default failover timeout of the framework.
constexpr Duration DEFAULT_FAILOVER_TIMEOUT = Weeks(1);

// Separates the task name from the unique suffix of a task id,
// e.g. `pod-0-task__2c8e0a6e-...`.
constexpr char TASK_NAME_DELIMITER[] = "__";

// Key of the reservation label which identifies a reserved resource.
constexpr char RESOURCE_ID_LABEL[] = "resource_id";

// Resource ids with this prefix have been unreserved already.
constexpr char TOMBSTONE_PREFIX[] = "uninstalled_";

// Key of the task label set on tasks which failed permanently.
constexpr char PERMANENTLY_FAILED_LABEL[] = "permanently-failed";

constexpr char PODS_PHASE_NAME[] = "pods";

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_CONSTANTS_HPP__

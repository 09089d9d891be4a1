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

#ifndef __CONDUCTOR_PLAN_STATUS_HPP__
#define __CONDUCTOR_PLAN_STATUS_HPP__

#include <ostream>

namespace conductor {
namespace plan {

// The status of an element of a plan. These are not linearly ordered:
// the status of a parent element is derived from the statuses of its
// children with an explicit precedence (see `ParentElement`).
enum class Status
{
  // Not yet started, no error.
  PENDING,

  // Preconditions satisfied, awaiting scheduling (e.g. waiting for
  // a suitable resource offer).
  PREPARED,

  // Dispatched, awaiting confirmation.
  STARTING,

  // Confirmed under way.
  IN_PROGRESS,

  // Blocked by an interruption or by a waiting child.
  WAITING,

  // Terminal success.
  COMPLETE,

  // Failure. An error anywhere in a subtree makes every ancestor
  // report `ERROR` as well.
  ERROR
};


std::ostream& operator<<(std::ostream& stream, const Status& status);

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_STATUS_HPP__

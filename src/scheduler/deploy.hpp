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

#ifndef __SCHEDULER_DEPLOY_HPP__
#define __SCHEDULER_DEPLOY_HPP__

#include <memory>
#include <string>

#include <stout/try.hpp>

#include <conductor/plan/plan.hpp>

#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

namespace conductor {
namespace internal {
namespace scheduler {

// Builds the `deploy` plan: a single phase `pods` with one
// `LaunchStep` per pod instance `pod-<i>`, ordered by the strategy
// named `strategy` ("serial" or "parallel").
Try<std::shared_ptr<plan::Plan>> buildDeployPlan(
    int pods,
    const std::string& command,
    const std::string& resources,
    const std::string& strategy,
    StateStore* stateStore,
    OfferPool* offerPool);

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_DEPLOY_HPP__

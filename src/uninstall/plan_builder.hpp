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

#ifndef __UNINSTALL_PLAN_BUILDER_HPP__
#define __UNINSTALL_PLAN_BUILDER_HPP__

#include <memory>
#include <string>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include <conductor/plan/plan.hpp>

#include "scheduler/driver.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

#include "uninstall/secrets.hpp"

namespace conductor {
namespace internal {
namespace uninstall {

constexpr char KILL_TASKS_PHASE_NAME[] = "kill-tasks";
constexpr char RESOURCE_PHASE_NAME[] = "unreserve-resources";
constexpr char TLS_CLEANUP_PHASE_NAME[] = "tls-cleanup";
constexpr char DEREGISTER_PHASE_NAME[] = "deregister-service";


/**
 * Builds the plan which uninstalls the service. It replaces the
 * deploy plan and therefore carries the same name.
 *
 * If no framework id is stored the framework never registered: all
 * state is cleared and an empty (thus complete) plan is returned.
 * Otherwise the plan kills every task, releases every reserved
 * resource, removes the TLS artifacts (only with a secrets client)
 * and finally deregisters the framework.
 */
Try<std::shared_ptr<plan::Plan>> buildUninstallPlan(
    scheduler::StateStore* stateStore,
    scheduler::DriverHandle* driver,
    scheduler::OfferPool* offerPool,
    const Option<SecretsClient*>& secrets,
    const std::string& secretsNamespace);

} // namespace uninstall {
} // namespace internal {
} // namespace conductor {

#endif // __UNINSTALL_PLAN_BUILDER_HPP__

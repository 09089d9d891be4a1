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

#ifndef __API_PLANS_HPP__
#define __API_PLANS_HPP__

#include <stdint.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <process/http.hpp>

#include <stout/error.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>

#include <conductor/plan/element.hpp>
#include <conductor/plan/phase.hpp>
#include <conductor/plan/plan.hpp>
#include <conductor/plan/plan_manager.hpp>

namespace conductor {
namespace internal {
namespace api {

// Returned when a command would not change anything.
constexpr uint16_t ALREADY_REPORTED = 208;

// Plan targeted by the deprecated single plan endpoints.
constexpr char DEPLOY_PLAN_NAME[] = "deploy";


/**
 * Commands for the inspection and steering of plans, independent of
 * the transport they arrive with. Every command resolves its target
 * in the following order:
 *
 *   1. The plan, by exact name (404 if unknown).
 *   2. A step filter without a phase filter is rejected (400).
 *   3. The phase filter, as a UUID or else as a name. It may match
 *      several phases, all of which are targeted (404 if none).
 *   4. The step filter, across the matched phases. Exactly one step
 *      must match (404 otherwise).
 *
 * Commands which would not change any of their targets respond with
 * `ALREADY_REPORTED` and leave the plan untouched.
 */
class PlansResource
{
public:
  explicit PlansResource(
      const std::vector<std::shared_ptr<plan::PlanManager>>& planManagers);

  // Names of all plans, in registration order.
  process::http::Response listPlans() const;

  // Snapshot of a plan. Responds `OK` if the plan is complete and
  // `Accepted` while it is not.
  process::http::Response getPlanInfo(const std::string& planName) const;

  // Merges `parameters` into the plan, restarts it if it was already
  // complete and lets it proceed.
  process::http::Response startPlan(
      const std::string& planName,
      const std::map<std::string, std::string>& parameters);

  // Interrupts the plan and resets all of its steps to `PENDING`.
  process::http::Response stopPlan(const std::string& planName);

  process::http::Response continueCommand(
      const std::string& planName,
      const Option<std::string>& phase);

  process::http::Response interruptCommand(
      const std::string& planName,
      const Option<std::string>& phase);

  process::http::Response forceCompleteCommand(
      const std::string& planName,
      const Option<std::string>& phase,
      const Option<std::string>& step);

  process::http::Response restartCommand(
      const std::string& planName,
      const Option<std::string>& phase,
      const Option<std::string>& step);

private:
  Option<std::shared_ptr<plan::PlanManager>> getPlanManager(
      const std::string& planName) const;

  const std::vector<std::shared_ptr<plan::PlanManager>> planManagers;
};


// Parameter names must be valid environment variable names, i.e.
// match `[A-Za-z_][A-Za-z0-9_]*`.
Option<Error> validateParameterName(const std::string& name);


// Returns the elements addressed by the given filters: the plan itself
// without filters, the matching phases with only a phase filter, or
// the single matching step. Empty if nothing matches.
// NOTE: A step filter requires a phase filter.
std::vector<plan::Element*> getPlanElements(
    const std::shared_ptr<plan::Plan>& plan,
    const Option<std::string>& phase,
    const Option<std::string>& step);


JSON::Object model(const plan::Plan& plan);
JSON::Object model(const plan::Phase& phase);
JSON::Object model(const plan::Step& step);


// The body of a successful command: the command and the elements it
// was applied to.
JSON::Object commandResult(
    const std::string& command,
    const std::vector<plan::Element*>& elements);

} // namespace api {
} // namespace internal {
} // namespace conductor {

#endif // __API_PLANS_HPP__

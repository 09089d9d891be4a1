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

#include "api/plans.hpp"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>
#include <stout/uuid.hpp>

#include "common/http.hpp"

using process::http::Accepted;
using process::http::BadRequest;
using process::http::NotFound;
using process::http::OK;
using process::http::Response;

using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::Element;
using conductor::plan::Phase;
using conductor::plan::Plan;
using conductor::plan::PlanManager;
using conductor::plan::Step;

namespace conductor {
namespace internal {
namespace api {

static Response planNotFound(const string& planName)
{
  return NotFound("Plan '" + planName + "' not found");
}


static Response phaseNotFound(
    const string& planName,
    const Option<string>& phase)
{
  return NotFound(
      "Phase '" + phase.getOrElse("") + "' not found in plan '" +
      planName + "'");
}


static Response phaseOrStepNotFound(
    const string& planName,
    const Option<string>& phase,
    const Option<string>& step)
{
  return NotFound(
      "Phase '" + phase.getOrElse("") + "' or step '" + step.getOrElse("") +
      "' not found in plan '" + planName + "'");
}


static Response alreadyReported()
{
  return Response(
      "Elements are already in requested state, nothing to do",
      ALREADY_REPORTED);
}


PlansResource::PlansResource(
    const vector<shared_ptr<PlanManager>>& _planManagers)
  : planManagers(_planManagers) {}


Response PlansResource::listPlans() const
{
  JSON::Array array;
  foreach (const shared_ptr<PlanManager>& planManager, planManagers) {
    array.values.push_back(planManager->getPlan()->getName());
  }

  return OK(array);
}


Response PlansResource::getPlanInfo(const string& planName) const
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  const shared_ptr<Plan> plan = planManager.get()->getPlan();

  const JSON::Object object = model(*plan);

  if (plan->isComplete()) {
    return OK(object);
  }

  Response response = Accepted(stringify(object));
  response.headers["Content-Type"] = APPLICATION_JSON;
  return response;
}


Response PlansResource::startPlan(
    const string& planName,
    const map<string, string>& parameters)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  foreachkey (const string& name, parameters) {
    Option<Error> error = validateParameterName(name);
    if (error.isSome()) {
      return BadRequest("Couldn't parse parameters: " + error->message);
    }
  }

  const shared_ptr<Plan> plan = planManager.get()->getPlan();

  plan->updateParameters(parameters);
  if (plan->isComplete()) {
    plan->restart();
  }
  plan->proceed();

  return OK(commandResult("start", {plan.get()}));
}


Response PlansResource::stopPlan(const string& planName)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  const shared_ptr<Plan> plan = planManager.get()->getPlan();

  plan->interrupt();
  plan->restart();

  return OK(commandResult("stop", {plan.get()}));
}


Response PlansResource::continueCommand(
    const string& planName,
    const Option<string>& phase)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  const vector<Element*> elements =
    getPlanElements(planManager.get()->getPlan(), phase, None());

  if (elements.empty()) {
    return phaseNotFound(planName, phase);
  }

  vector<Element*> targets;
  foreach (Element* element, elements) {
    if (!element->isInProgress() && !element->isComplete()) {
      targets.push_back(element);
    }
  }

  if (targets.empty()) {
    return alreadyReported();
  }

  foreach (Element* element, targets) {
    element->proceed();
  }

  return OK(commandResult("continue", targets));
}


Response PlansResource::interruptCommand(
    const string& planName,
    const Option<string>& phase)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  const vector<Element*> elements =
    getPlanElements(planManager.get()->getPlan(), phase, None());

  if (elements.empty()) {
    return phaseNotFound(planName, phase);
  }

  vector<Element*> targets;
  foreach (Element* element, elements) {
    if (!element->isComplete() && !element->isInterrupted()) {
      targets.push_back(element);
    }
  }

  if (targets.empty()) {
    return alreadyReported();
  }

  foreach (Element* element, targets) {
    element->interrupt();
  }

  return OK(commandResult("interrupt", targets));
}


Response PlansResource::forceCompleteCommand(
    const string& planName,
    const Option<string>& phase,
    const Option<string>& step)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  if (phase.isNone() && step.isSome()) {
    return BadRequest("Expecting 'phase' when 'step' is present");
  }

  const vector<Element*> elements =
    getPlanElements(planManager.get()->getPlan(), phase, step);

  if (elements.empty()) {
    return phaseOrStepNotFound(planName, phase, step);
  }

  vector<Element*> targets;
  foreach (Element* element, elements) {
    if (!element->isComplete()) {
      targets.push_back(element);
    }
  }

  if (targets.empty()) {
    return alreadyReported();
  }

  foreach (Element* element, targets) {
    element->forceComplete();
  }

  return OK(commandResult("forceComplete", targets));
}


Response PlansResource::restartCommand(
    const string& planName,
    const Option<string>& phase,
    const Option<string>& step)
{
  Option<shared_ptr<PlanManager>> planManager = getPlanManager(planName);
  if (planManager.isNone()) {
    return planNotFound(planName);
  }

  if (phase.isNone() && step.isSome()) {
    return BadRequest("Expecting 'phase' when 'step' is present");
  }

  const vector<Element*> elements =
    getPlanElements(planManager.get()->getPlan(), phase, step);

  if (elements.empty()) {
    return phaseOrStepNotFound(planName, phase, step);
  }

  foreach (Element* element, elements) {
    element->restart();
  }

  foreach (Element* element, elements) {
    element->proceed();
  }

  return OK(commandResult("restart", elements));
}


Option<shared_ptr<PlanManager>> PlansResource::getPlanManager(
    const string& planName) const
{
  foreach (const shared_ptr<PlanManager>& planManager, planManagers) {
    if (planManager->getPlan()->getName() == planName) {
      return planManager;
    }
  }

  return None();
}


Option<Error> validateParameterName(const string& name)
{
  auto invalidCharacter = [](char c) {
    return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_');
  };

  if (name.empty() ||
      std::isdigit(static_cast<unsigned char>(name[0])) ||
      std::any_of(name.begin(), name.end(), invalidCharacter)) {
    return Error(name + " is not a valid environment variable name");
  }

  return None();
}


// Matches the `filter` against the ids of the given elements if it
// parses as a UUID, and against their names otherwise.
template <typename T>
static vector<shared_ptr<T>> match(
    const vector<shared_ptr<T>>& elements,
    const string& filter)
{
  vector<shared_ptr<T>> result;

  Try<id::UUID> uuid = id::UUID::fromString(filter);

  foreach (const shared_ptr<T>& element, elements) {
    if (uuid.isSome() ? element->getId() == uuid.get()
                      : element->getName() == filter) {
      result.push_back(element);
    }
  }

  return result;
}


vector<Element*> getPlanElements(
    const shared_ptr<Plan>& plan,
    const Option<string>& phase,
    const Option<string>& step)
{
  vector<Element*> elements;

  if (phase.isNone()) {
    CHECK_NONE(step) << "A step filter requires a phase filter";

    elements.push_back(plan.get());
    return elements;
  }

  const vector<shared_ptr<Phase>> phases =
    match(plan->getChildren(), phase.get());

  if (step.isNone()) {
    foreach (const shared_ptr<Phase>& matched, phases) {
      elements.push_back(matched.get());
    }
    return elements;
  }

  vector<shared_ptr<Step>> steps;
  foreach (const shared_ptr<Phase>& matched, phases) {
    foreach (const shared_ptr<Step>& candidate,
             match(matched->getChildren(), step.get())) {
      steps.push_back(candidate);
    }
  }

  if (steps.size() != 1) {
    LOG(ERROR) << "Expected 1 step '" << step.get() << "' across "
               << phases.size() << " phase(s), got " << steps.size();
    return elements;
  }

  elements.push_back(steps.front().get());
  return elements;
}


JSON::Object model(const Step& step)
{
  JSON::Object object;
  object.values["id"] = step.getId().toString();
  object.values["name"] = step.getName();
  object.values["status"] = stringify(step.getStatus());
  object.values["message"] = stringify(step);
  return object;
}


JSON::Object model(const Phase& phase)
{
  JSON::Object object;
  object.values["id"] = phase.getId().toString();
  object.values["name"] = phase.getName();
  object.values["status"] = stringify(phase.getStatus());

  {
    JSON::Array array;
    foreach (const shared_ptr<Step>& step, phase.getChildren()) {
      array.values.push_back(model(*step));
    }

    object.values["steps"] = std::move(array);
  }

  return object;
}


JSON::Object model(const Plan& plan)
{
  JSON::Object object;
  object.values["id"] = plan.getId().toString();
  object.values["name"] = plan.getName();
  object.values["status"] = stringify(plan.getStatus());
  object.values["strategy"] = plan.getStrategy().getName();

  {
    JSON::Array array;
    foreach (const string& error, plan.getErrors()) {
      array.values.push_back(error);
    }

    object.values["errors"] = std::move(array);
  }

  {
    JSON::Array array;
    foreach (const shared_ptr<Phase>& phase, plan.getChildren()) {
      array.values.push_back(model(*phase));
    }

    object.values["phases"] = std::move(array);
  }

  return object;
}


JSON::Object commandResult(
    const string& command,
    const vector<Element*>& elements)
{
  JSON::Object object;
  object.values["message"] = "Received cmd: " + command;

  JSON::Array array;
  foreach (const Element* element, elements) {
    JSON::Object entry;
    entry.values["id"] = element->getId().toString();
    entry.values["name"] = element->getName();
    entry.values["type"] = element->getType();
    array.values.push_back(entry);
  }

  object.values["elements"] = std::move(array);

  return object;
}

} // namespace api {
} // namespace internal {
} // namespace conductor {

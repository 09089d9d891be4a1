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

#include "api/process.hpp"

#include <process/help.hpp>

#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>
#include <stout/strings.hpp>

#include "common/http.hpp"

using process::DESCRIPTION;
using process::Future;
using process::HELP;
using process::TLDR;

using process::http::BadRequest;
using process::http::MethodNotAllowed;
using process::http::NotFound;
using process::http::Request;
using process::http::Response;

using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

namespace conductor {
namespace internal {
namespace api {

static const string PLANS_HELP()
{
  return HELP(
    TLDR(
        "Inspects and steers the plans of this scheduler."),
    DESCRIPTION(
        "GET  /v1/plans",
        "     Lists the names of all plans.",
        "",
        "GET  /v1/plans/{name}",
        "     Snapshot of the plan, 200 if complete and 202 otherwise.",
        "",
        "POST /v1/plans/{name}/start",
        "     Merges the JSON object of string parameters in the body",
        "     into the plan, restarts it if complete, and proceeds.",
        "",
        "POST /v1/plans/{name}/stop",
        "     Interrupts the plan and resets all of its steps.",
        "",
        "POST /v1/plans/{name}/continue[?phase=]",
        "POST /v1/plans/{name}/interrupt[?phase=]",
        "POST /v1/plans/{name}/forceComplete[?phase=[&step=]]",
        "POST /v1/plans/{name}/restart[?phase=[&step=]]",
        "     Phases and steps may be given by id or by name."));
}


static const string PLAN_HELP()
{
  return HELP(
    TLDR(
        "Deprecated. Same as '/v1/plans/deploy'."),
    DESCRIPTION(
        "GET  /v1/plan",
        "POST /v1/plan/continue",
        "POST /v1/plan/interrupt",
        "POST /v1/plan/forceComplete[?phase=[&step=]]",
        "POST /v1/plan/restart[?phase=[&step=]]"));
}


PlansProcess::PlansProcess(
    const vector<shared_ptr<plan::PlanManager>>& planManagers)
  : ProcessBase("v1"),
    resource(planManagers) {}


void PlansProcess::initialize()
{
  route("/plans", PLANS_HELP(), &PlansProcess::plans);
  route("/plan", PLAN_HELP(), &PlansProcess::plan);
}


Future<Response> PlansProcess::plans(const Request& request)
{
  logRequest(request);

  const Response response = _plans(request);

  logResponse(request, response);

  return response;
}


Response PlansProcess::_plans(const Request& request)
{
  // Either {"plans"}, {"plans", name} or {"plans", name, command}.
  const vector<string> tokens = tokenize(request);

  if (tokens.size() == 1 || tokens.size() == 2) {
    if (request.method != "GET") {
      return MethodNotAllowed({"GET"}, request.method);
    }

    return tokens.size() == 1
      ? resource.listPlans()
      : resource.getPlanInfo(tokens[1]);
  }

  if (tokens.size() == 3) {
    return command(request, tokens[1], tokens[2]);
  }

  return NotFound();
}


Future<Response> PlansProcess::plan(const Request& request)
{
  logRequest(request);

  const Response response = _plan(request);

  logResponse(request, response);

  return response;
}


Response PlansProcess::_plan(const Request& request)
{
  // Either {"plan"} or {"plan", command}.
  const vector<string> tokens = tokenize(request);

  if (tokens.size() == 1) {
    if (request.method != "GET") {
      return MethodNotAllowed({"GET"}, request.method);
    }

    return resource.getPlanInfo(DEPLOY_PLAN_NAME);
  }

  // Only these commands ever had a deprecated endpoint.
  if (tokens.size() == 2 &&
      (tokens[1] == "continue" ||
       tokens[1] == "interrupt" ||
       tokens[1] == "forceComplete" ||
       tokens[1] == "restart")) {
    return command(request, DEPLOY_PLAN_NAME, tokens[1]);
  }

  return NotFound();
}


Response PlansProcess::command(
    const Request& request,
    const string& planName,
    const string& command)
{
  if (request.method != "POST") {
    return MethodNotAllowed({"POST"}, request.method);
  }

  const Option<string> phase = request.url.query.get("phase");
  const Option<string> step = request.url.query.get("step");

  if (command == "start") {
    Try<map<string, string>> parameters = parseParameters(request.body);
    if (parameters.isError()) {
      return BadRequest(
          "Couldn't parse parameters: " + parameters.error());
    }

    return resource.startPlan(planName, parameters.get());
  } else if (command == "stop") {
    return resource.stopPlan(planName);
  } else if (command == "continue") {
    return resource.continueCommand(planName, phase);
  } else if (command == "interrupt") {
    return resource.interruptCommand(planName, phase);
  } else if (command == "forceComplete") {
    return resource.forceCompleteCommand(planName, phase, step);
  } else if (command == "restart") {
    return resource.restartCommand(planName, phase, step);
  }

  return NotFound("Unknown command '" + command + "'");
}


vector<string> PlansProcess::tokenize(const Request& request) const
{
  const string id = self().id;

  vector<string> tokens = strings::tokenize(request.url.path, "/");

  if (!tokens.empty() && tokens.front() == id) {
    tokens.erase(tokens.begin());
  }

  return tokens;
}


Try<map<string, string>> parseParameters(const string& body)
{
  map<string, string> parameters;

  if (strings::trim(body).empty()) {
    return parameters;
  }

  Try<JSON::Object> object = JSON::parse<JSON::Object>(body);
  if (object.isError()) {
    return Error("Failed to parse body into JSON: " + object.error());
  }

  foreachpair (const string& key, const JSON::Value& value,
               object->values) {
    if (!value.is<JSON::String>()) {
      return Error("Value of '" + key + "' is not a string");
    }

    parameters[key] = value.as<JSON::String>().value;
  }

  return parameters;
}

} // namespace api {
} // namespace internal {
} // namespace conductor {

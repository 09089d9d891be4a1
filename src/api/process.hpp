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

#ifndef __API_PROCESS_HPP__
#define __API_PROCESS_HPP__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/http.hpp>
#include <process/process.hpp>

#include <stout/try.hpp>

#include <conductor/plan/plan_manager.hpp>

#include "api/plans.hpp"

namespace conductor {
namespace internal {
namespace api {

// The actor serving the plans API under `/v1`.
class PlansProcess : public process::Process<PlansProcess>
{
public:
  explicit PlansProcess(
      const std::vector<std::shared_ptr<plan::PlanManager>>& planManagers);

  ~PlansProcess() override {}

protected:
  void initialize() override;

private:
  // /v1/plans[/{name}[/{command}]]
  process::Future<process::http::Response> plans(
      const process::http::Request& request);

  // /v1/plan[/{command}], forwarded to the deploy plan.
  process::Future<process::http::Response> plan(
      const process::http::Request& request);

  process::http::Response _plans(const process::http::Request& request);

  process::http::Response _plan(const process::http::Request& request);

  process::http::Response command(
      const process::http::Request& request,
      const std::string& planName,
      const std::string& command);

  // Strips the id of this process from the path of `request`.
  std::vector<std::string> tokenize(
      const process::http::Request& request) const;

  PlansResource resource;
};


// Parses the body of a start command: a JSON object of string
// values. An empty body holds no parameters.
Try<std::map<std::string, std::string>> parseParameters(
    const std::string& body);

} // namespace api {
} // namespace internal {
} // namespace conductor {

#endif // __API_PROCESS_HPP__

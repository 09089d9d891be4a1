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

#include "scheduler/deploy.hpp"

#include <vector>

#include <glog/logging.h>

#include <mesos/resources.hpp>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

#include <conductor/plan/phase.hpp>
#include <conductor/plan/step.hpp>
#include <conductor/plan/strategy.hpp>

#include "api/plans.hpp"

#include "scheduler/constants.hpp"
#include "scheduler/launch_step.hpp"

using mesos::Resources;

using process::Owned;

using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::ParallelStrategy;
using conductor::plan::Phase;
using conductor::plan::Plan;
using conductor::plan::SerialStrategy;
using conductor::plan::Step;
using conductor::plan::Strategy;

namespace conductor {
namespace internal {
namespace scheduler {

Try<shared_ptr<Plan>> buildDeployPlan(
    int pods,
    const string& command,
    const string& resources,
    const string& strategy,
    StateStore* stateStore,
    OfferPool* offerPool)
{
  if (pods < 0) {
    return Error("Expecting a non-negative number of pods");
  }

  Try<Resources> podResources = Resources::parse(resources);
  if (podResources.isError()) {
    return Error("Invalid pod resources: " + podResources.error());
  }

  Owned<Strategy<Step>> phaseStrategy;
  if (strategy == "serial") {
    phaseStrategy.reset(new SerialStrategy<Step>());
  } else if (strategy == "parallel") {
    phaseStrategy.reset(new ParallelStrategy<Step>());
  } else {
    return Error("Unknown deploy strategy '" + strategy + "'");
  }

  vector<shared_ptr<Step>> steps;
  for (int i = 0; i < pods; i++) {
    steps.push_back(std::make_shared<LaunchStep>(
        "pod-" + stringify(i),
        command,
        podResources.get(),
        stateStore,
        offerPool));
  }

  shared_ptr<Phase> phase =
    std::make_shared<Phase>(PODS_PHASE_NAME, steps, phaseStrategy);

  LOG(INFO) << "Built deploy plan with " << pods << " pod(s) deployed in "
            << strategy << " order";

  return std::make_shared<Plan>(
      api::DEPLOY_PLAN_NAME,
      vector<shared_ptr<Phase>>{phase});
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

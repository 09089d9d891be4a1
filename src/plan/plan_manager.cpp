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

#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/option.hpp>

#include <conductor/plan/plan_manager.hpp>

using std::shared_ptr;
using std::string;
using std::vector;

namespace conductor {
namespace plan {

DefaultPlanManager::DefaultPlanManager(const shared_ptr<Plan>& _plan)
  : plan(_plan)
{
  CHECK_NOTNULL(plan.get());

  plan->interrupt();
}


shared_ptr<Plan> DefaultPlanManager::getPlan() const
{
  return plan;
}


vector<shared_ptr<Step>> DefaultPlanManager::getCandidates(
    const hashset<string>& dirtyAssets) const
{
  vector<shared_ptr<Step>> candidates;

  const vector<shared_ptr<Phase>> phases =
    plan->getStrategy().getCandidates(plan->getChildren(), dirtyAssets);

  foreach (const shared_ptr<Phase>& phase, phases) {
    if (phase->isInterrupted()) {
      continue;
    }

    const vector<shared_ptr<Step>> steps =
      phase->getStrategy().getCandidates(phase->getChildren(), dirtyAssets);

    foreach (const shared_ptr<Step>& step, steps) {
      if (step->isEligible(dirtyAssets)) {
        candidates.push_back(step);
      }
    }
  }

  VLOG(1) << "Plan '" << plan->getName() << "' has " << candidates.size()
          << " candidate step(s)";

  return candidates;
}


hashset<string> DefaultPlanManager::getDirtyAssets() const
{
  hashset<string> dirtyAssets;

  foreach (const shared_ptr<Phase>& phase, plan->getChildren()) {
    foreach (const shared_ptr<Step>& step, phase->getChildren()) {
      const Option<string> asset = step->getAsset();
      if (asset.isNone()) {
        continue;
      }

      const Status status = step->getStatus();
      if (status == Status::PREPARED ||
          status == Status::STARTING ||
          status == Status::IN_PROGRESS) {
        dirtyAssets.insert(asset.get());
      }
    }
  }

  return dirtyAssets;
}

} // namespace plan {
} // namespace conductor {

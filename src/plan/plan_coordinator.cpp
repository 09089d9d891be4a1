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
#include <stout/hashset.hpp>
#include <stout/option.hpp>
#include <stout/synchronized.hpp>

#include <conductor/plan/plan_coordinator.hpp>

using std::shared_ptr;
using std::string;
using std::vector;

namespace conductor {
namespace plan {

PlanCoordinator::PlanCoordinator(
    const vector<shared_ptr<PlanManager>>& _planManagers)
  : planManagers(_planManagers)
{
  foreach (const shared_ptr<PlanManager>& planManager, planManagers) {
    CHECK_NOTNULL(planManager.get());
  }
}


vector<shared_ptr<Step>> PlanCoordinator::getCandidates()
{
  synchronized (mutex) {
    vector<shared_ptr<Step>> candidates;

    // Assets of the steps handed out earlier in this cycle.
    hashset<string> claimed;

    foreach (const shared_ptr<PlanManager>& planManager, planManagers) {
      hashset<string> dirtyAssets = claimed;

      foreach (const shared_ptr<PlanManager>& other, planManagers) {
        if (other == planManager) {
          continue;
        }

        foreach (const string& asset, other->getDirtyAssets()) {
          dirtyAssets.insert(asset);
        }
      }

      foreach (const shared_ptr<Step>& step,
               planManager->getCandidates(dirtyAssets)) {
        candidates.push_back(step);

        const Option<string> asset = step->getAsset();
        if (asset.isSome()) {
          claimed.insert(asset.get());
        }
      }
    }

    return candidates;
  }
}


const vector<shared_ptr<PlanManager>>& PlanCoordinator::getPlanManagers() const
{
  return planManagers;
}

} // namespace plan {
} // namespace conductor {

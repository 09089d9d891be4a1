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

#ifndef __CONDUCTOR_PLAN_PLAN_COORDINATOR_HPP__
#define __CONDUCTOR_PLAN_PLAN_COORDINATOR_HPP__

#include <memory>
#include <mutex>
#include <vector>

#include <conductor/plan/plan_manager.hpp>
#include <conductor/plan/step.hpp>

namespace conductor {
namespace plan {

// Selects candidate steps across several plans so that no two steps
// working on the same asset are handed out by the same cycle, nor
// while another plan is already working on that asset.
class PlanCoordinator
{
public:
  explicit PlanCoordinator(
      const std::vector<std::shared_ptr<PlanManager>>& planManagers);

  // Returns the candidates of every plan manager, in manager order.
  std::vector<std::shared_ptr<Step>> getCandidates();

  const std::vector<std::shared_ptr<PlanManager>>& getPlanManagers() const;

private:
  const std::vector<std::shared_ptr<PlanManager>> planManagers;

  std::mutex mutex;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_PLAN_COORDINATOR_HPP__

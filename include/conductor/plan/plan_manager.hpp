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

#ifndef __CONDUCTOR_PLAN_PLAN_MANAGER_HPP__
#define __CONDUCTOR_PLAN_PLAN_MANAGER_HPP__

#include <memory>
#include <string>
#include <vector>

#include <stout/hashset.hpp>

#include <conductor/plan/plan.hpp>
#include <conductor/plan/step.hpp>

namespace conductor {
namespace plan {

/**
 * Owns one plan and selects the steps of that plan which should be
 * started next.
 */
class PlanManager
{
public:
  virtual ~PlanManager() {}

  virtual std::shared_ptr<Plan> getPlan() const = 0;

  /**
   * Returns the steps which may be started now: the candidate steps of
   * the candidate phases, chosen by the plan's and the phases'
   * strategies, minus interrupted steps and steps working on one of
   * the `dirtyAssets`.
   */
  virtual std::vector<std::shared_ptr<Step>> getCandidates(
      const hashset<std::string>& dirtyAssets) const = 0;

  /**
   * Returns the assets of the steps of this plan whose work is under
   * way, i.e. which are `PREPARED`, `STARTING` or `IN_PROGRESS`.
   */
  virtual hashset<std::string> getDirtyAssets() const = 0;
};


class DefaultPlanManager : public PlanManager
{
public:
  // NOTE: The plan is interrupted once here. Work starts only after
  // `proceed()` is called on it, e.g. once the framework registered.
  explicit DefaultPlanManager(const std::shared_ptr<Plan>& plan);

  ~DefaultPlanManager() override {}

  std::shared_ptr<Plan> getPlan() const override;

  std::vector<std::shared_ptr<Step>> getCandidates(
      const hashset<std::string>& dirtyAssets) const override;

  hashset<std::string> getDirtyAssets() const override;

private:
  const std::shared_ptr<Plan> plan;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_PLAN_MANAGER_HPP__

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

#ifndef __SCHEDULER_LAUNCH_STEP_HPP__
#define __SCHEDULER_LAUNCH_STEP_HPP__

#include <map>
#include <mutex>
#include <string>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>

#include <stout/option.hpp>

#include <conductor/plan/step.hpp>

#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

namespace conductor {
namespace internal {
namespace scheduler {

/**
 * Launches the task of one pod instance and follows it until it runs.
 *
 * The step is named `<pod>-task` and works on the asset `<pod>`. A
 * step whose task is recorded as running in the state store starts
 * out `COMPLETE`. Plan parameters are passed to the task as
 * environment variables.
 */
class LaunchStep : public plan::Step
{
public:
  LaunchStep(
      const std::string& podInstance,
      const std::string& command,
      const mesos::Resources& resources,
      StateStore* stateStore,
      OfferPool* offerPool);

  ~LaunchStep() override {}

  std::string getType() const override;

  Option<std::string> getAsset() const override;

  void start() override;

  void update(const mesos::TaskStatus& status) override;

  void updateParameters(
      const std::map<std::string, std::string>& parameters) override;

  // The id of the task launched most recently, if any.
  Option<mesos::TaskID> getTaskId() const;

private:
  // Picks up a task launched by a previous run of the scheduler.
  void recover();

  const std::string podInstance;
  const std::string command;
  const mesos::Resources resources;

  StateStore* stateStore;
  OfferPool* offerPool;

  mutable std::mutex mutex;
  std::map<std::string, std::string> parameters;
  Option<mesos::TaskID> taskId;
};

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_LAUNCH_STEP_HPP__

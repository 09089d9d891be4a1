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

#ifndef __SCHEDULER_SCHEDULER_HPP__
#define __SCHEDULER_SCHEDULER_HPP__

#include <string>
#include <vector>

#include <mesos/mesos.hpp>
#include <mesos/scheduler.hpp>

#include <conductor/plan/plan_coordinator.hpp>

#include "scheduler/driver.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

namespace conductor {
namespace internal {
namespace scheduler {

/**
 * Drives the plans of a coordinator forward as offers arrive.
 *
 * Every offer cycle pools the offers, starts all candidate steps
 * against the pool and then answers every offer at once. Task status
 * updates are recorded in the state store and passed to every plan.
 *
 * Plans stay interrupted until the framework has registered.
 */
class PlanScheduler : public mesos::Scheduler
{
public:
  PlanScheduler(
      StateStore* stateStore,
      MesosDriverHandle* driver,
      OfferPool* offerPool,
      plan::PlanCoordinator* coordinator);

  ~PlanScheduler() override {}

  void registered(
      mesos::SchedulerDriver* driver,
      const mesos::FrameworkID& frameworkId,
      const mesos::MasterInfo& masterInfo) override;

  void reregistered(
      mesos::SchedulerDriver* driver,
      const mesos::MasterInfo& masterInfo) override;

  void disconnected(mesos::SchedulerDriver* driver) override;

  void resourceOffers(
      mesos::SchedulerDriver* driver,
      const std::vector<mesos::Offer>& offers) override;

  void offerRescinded(
      mesos::SchedulerDriver* driver,
      const mesos::OfferID& offerId) override;

  void statusUpdate(
      mesos::SchedulerDriver* driver,
      const mesos::TaskStatus& status) override;

  void frameworkMessage(
      mesos::SchedulerDriver* driver,
      const mesos::ExecutorID& executorId,
      const mesos::SlaveID& slaveId,
      const std::string& data) override;

  void slaveLost(
      mesos::SchedulerDriver* driver,
      const mesos::SlaveID& slaveId) override;

  void executorLost(
      mesos::SchedulerDriver* driver,
      const mesos::ExecutorID& executorId,
      const mesos::SlaveID& slaveId,
      int status) override;

  void error(
      mesos::SchedulerDriver* driver,
      const std::string& message) override;

  // The driver independent parts of the callbacks above.
  void initialize(const mesos::FrameworkID& frameworkId);
  void processOffers(const std::vector<mesos::Offer>& offers);
  void processStatus(const mesos::TaskStatus& status);

private:
  StateStore* stateStore;
  MesosDriverHandle* driver;
  OfferPool* offerPool;
  plan::PlanCoordinator* coordinator;
};

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_SCHEDULER_HPP__

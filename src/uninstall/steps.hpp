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

#ifndef __UNINSTALL_STEPS_HPP__
#define __UNINSTALL_STEPS_HPP__

#include <string>

#include <mesos/mesos.hpp>

#include <stout/option.hpp>

#include <conductor/plan/status.hpp>
#include <conductor/plan/step.hpp>

#include "scheduler/driver.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/state_store.hpp"

#include "uninstall/secrets.hpp"

namespace conductor {
namespace internal {
namespace uninstall {

// Kills one task. Completes once a terminal status for the task
// arrives.
class TaskKillStep : public plan::Step
{
public:
  TaskKillStep(
      const mesos::TaskID& taskId,
      scheduler::DriverHandle* driver,
      const plan::Status& initial = plan::Status::PENDING);

  std::string getType() const override;

  void start() override;

  void update(const mesos::TaskStatus& status) override;

private:
  const mesos::TaskID taskId;
  scheduler::DriverHandle* driver;
};


// Releases one reserved resource (destroying it first if it is a
// persistent volume) as soon as an offer holds it.
class ResourceCleanupStep : public plan::Step
{
public:
  ResourceCleanupStep(
      const std::string& resourceId,
      scheduler::OfferPool* offerPool,
      const plan::Status& initial = plan::Status::PENDING);

  std::string getType() const override;

  Option<std::string> getAsset() const override;

  void start() override;

private:
  const std::string resourceId;
  scheduler::OfferPool* offerPool;
};


// Removes the TLS artifacts of the service from the secret store.
// Any failure leaves the step pending so that it is retried.
class TLSCleanupStep : public plan::Step
{
public:
  TLSCleanupStep(SecretsClient* secrets, const std::string& ns);

  std::string getType() const override;

  void start() override;

private:
  SecretsClient* secrets;
  const std::string ns;
};


// Forgets the framework id, tears the framework down and wipes all
// remaining state of the service.
class DeregisterStep : public plan::Step
{
public:
  DeregisterStep(
      scheduler::StateStore* stateStore,
      scheduler::DriverHandle* driver);

  std::string getType() const override;

  void start() override;

private:
  scheduler::StateStore* stateStore;
  scheduler::DriverHandle* driver;
};


// Whether the secret is one of the TLS artifacts written for a task.
bool isTLSArtifact(const std::string& name);

} // namespace uninstall {
} // namespace internal {
} // namespace conductor {

#endif // __UNINSTALL_STEPS_HPP__

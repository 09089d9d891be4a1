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

#ifndef __SCHEDULER_DRIVER_HPP__
#define __SCHEDULER_DRIVER_HPP__

#include <atomic>
#include <vector>

#include <mesos/mesos.hpp>
#include <mesos/scheduler.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace conductor {
namespace internal {
namespace scheduler {

// The calls into the scheduler driver made by plans and offer pools.
// Every call fails if the driver is not (or no longer) running.
class DriverHandle
{
public:
  virtual ~DriverHandle() {}

  virtual Try<Nothing> acceptOffers(
      const std::vector<mesos::OfferID>& offerIds,
      const std::vector<mesos::Offer::Operation>& operations,
      const mesos::Filters& filters) = 0;

  virtual Try<Nothing> declineOffer(
      const mesos::OfferID& offerId,
      const mesos::Filters& filters) = 0;

  virtual Try<Nothing> killTask(const mesos::TaskID& taskId) = 0;

  // Stops the driver. With `failover` false the framework is torn
  // down by the master.
  virtual Try<Nothing> stop(bool failover) = 0;
};


// Forwards to a `mesos::SchedulerDriver`, which is set once the
// driver has been created. Until then, or once reset to null, every
// call fails.
class MesosDriverHandle : public DriverHandle
{
public:
  MesosDriverHandle() : driver(nullptr) {}

  ~MesosDriverHandle() override {}

  void setDriver(mesos::SchedulerDriver* driver);

  Try<Nothing> acceptOffers(
      const std::vector<mesos::OfferID>& offerIds,
      const std::vector<mesos::Offer::Operation>& operations,
      const mesos::Filters& filters) override;

  Try<Nothing> declineOffer(
      const mesos::OfferID& offerId,
      const mesos::Filters& filters) override;

  Try<Nothing> killTask(const mesos::TaskID& taskId) override;

  Try<Nothing> stop(bool failover) override;

private:
  std::atomic<mesos::SchedulerDriver*> driver;
};

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_DRIVER_HPP__

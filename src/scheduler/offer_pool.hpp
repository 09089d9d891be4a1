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

#ifndef __SCHEDULER_OFFER_POOL_HPP__
#define __SCHEDULER_OFFER_POOL_HPP__

#include <string>
#include <vector>

#include <mesos/mesos.hpp>
#include <mesos/resources.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "scheduler/driver.hpp"

namespace conductor {
namespace internal {
namespace scheduler {

/**
 * The offers of the current offer cycle. Steps queue operations
 * against the pooled offers while they are started; `flush()` then
 * accepts every offer with queued operations and declines the others.
 *
 * NOTE: Only used from the scheduler driver thread.
 */
class OfferPool
{
public:
  explicit OfferPool(DriverHandle* driver);

  void add(const std::vector<mesos::Offer>& offers);

  void rescind(const mesos::OfferID& offerId);

  // Queues the launch of `task` on the first offer with enough
  // remaining resources. Returns the task as it will be launched.
  Option<mesos::TaskInfo> launch(const mesos::TaskInfo& task);

  // Queues the release of the reserved resource labelled with
  // `resourceId`: DESTROY if it is a persistent volume, then
  // UNRESERVE. Returns false if no pooled offer holds the resource.
  bool cleanup(const std::string& resourceId);

  // Accepts or declines all pooled offers and empties the pool.
  Try<Nothing> flush();

  size_t size() const;

private:
  struct Entry
  {
    explicit Entry(const mesos::Offer& _offer)
      : offer(_offer), remaining(_offer.resources()) {}

    mesos::Offer offer;
    mesos::Resources remaining;
    std::vector<mesos::Offer::Operation> operations;
  };

  DriverHandle* driver;
  std::vector<Entry> entries;
};

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_OFFER_POOL_HPP__

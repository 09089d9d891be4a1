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

#ifndef __CONDUCTOR_PLAN_STRATEGY_HPP__
#define __CONDUCTOR_PLAN_STRATEGY_HPP__

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>

#include <conductor/plan/interruptible.hpp>

namespace conductor {
namespace plan {

/**
 * Selects which children of a parent element are ready to be worked
 * on. A strategy may be interrupted, in which case it returns no
 * candidates at all until `proceed()` is called. The interrupted flag
 * of a strategy is independent of the flags of the children.
 *
 * @param C the type of the children the strategy applies to.
 */
template <typename C>
class Strategy : public Interruptible
{
public:
  ~Strategy() override {}

  /**
   * Returns the children, if any, which may have work performed
   * against them. Completed children and children touching any of
   * the `dirtyAssets` (assets already being worked on elsewhere) are
   * never returned.
   */
  virtual std::vector<std::shared_ptr<C>> getCandidates(
      const std::vector<std::shared_ptr<C>>& elements,
      const hashset<std::string>& dirtyAssets) const = 0;

  // Name of the strategy, as shown in plan snapshots.
  virtual std::string getName() const = 0;
};


// Implements the interrupted flag shared by all strategies.
template <typename C>
class InterruptibleStrategy : public Strategy<C>
{
public:
  InterruptibleStrategy() : interrupted(false) {}

  bool interrupt() override
  {
    return !interrupted.exchange(true);
  }

  bool proceed() override
  {
    return interrupted.exchange(false);
  }

  bool isInterrupted() const override
  {
    return interrupted.load();
  }

private:
  std::atomic<bool> interrupted;
};


// Works on one child at a time, in order. Only the first incomplete
// child may be a candidate; if that child touches a dirty asset
// nothing is returned (later children are never reached early).
template <typename C>
class SerialStrategy : public InterruptibleStrategy<C>
{
public:
  std::vector<std::shared_ptr<C>> getCandidates(
      const std::vector<std::shared_ptr<C>>& elements,
      const hashset<std::string>& dirtyAssets) const override
  {
    std::vector<std::shared_ptr<C>> candidates;

    if (this->isInterrupted()) {
      return candidates;
    }

    foreach (const std::shared_ptr<C>& element, elements) {
      if (element->isComplete()) {
        continue;
      }

      if (!element->hasConflicts(dirtyAssets)) {
        candidates.push_back(element);
      }

      break;
    }

    return candidates;
  }

  std::string getName() const override
  {
    return "serial";
  }
};


// Works on every incomplete child which does not touch a dirty asset.
template <typename C>
class ParallelStrategy : public InterruptibleStrategy<C>
{
public:
  std::vector<std::shared_ptr<C>> getCandidates(
      const std::vector<std::shared_ptr<C>>& elements,
      const hashset<std::string>& dirtyAssets) const override
  {
    std::vector<std::shared_ptr<C>> candidates;

    if (this->isInterrupted()) {
      return candidates;
    }

    foreach (const std::shared_ptr<C>& element, elements) {
      if (!element->isComplete() && !element->hasConflicts(dirtyAssets)) {
        candidates.push_back(element);
      }
    }

    return candidates;
  }

  std::string getName() const override
  {
    return "parallel";
  }
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_STRATEGY_HPP__

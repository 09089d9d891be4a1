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

#ifndef __CONDUCTOR_PLAN_STEP_HPP__
#define __CONDUCTOR_PLAN_STEP_HPP__

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <mesos/mesos.hpp>

#include <stout/hashset.hpp>
#include <stout/option.hpp>
#include <stout/uuid.hpp>

#include <conductor/plan/element.hpp>
#include <conductor/plan/observer.hpp>
#include <conductor/plan/status.hpp>

namespace conductor {
namespace plan {

/**
 * The leaf of a plan: a single unit of work.
 *
 * A step stores its own status and interrupted flag behind one mutex.
 * While interrupted, a step which would otherwise report `PENDING` or
 * `PREPARED` reports `WAITING` instead; `COMPLETE` and `ERROR` are
 * never masked.
 *
 * Every status change (but not a write of the current status) is
 * announced to the subscribed observers, outside of the lock.
 */
class Step : public Element, public Observable
{
public:
  explicit Step(
      const std::string& name,
      const Status& initial = Status::PENDING);

  ~Step() override {}

  const id::UUID& getId() const override;

  const std::string& getName() const override;

  std::string getType() const override;

  Status getStatus() const override;

  std::vector<std::string> getErrors() const override;

  bool interrupt() override;

  bool proceed() override;

  bool isInterrupted() const override;

  // Default: ignores the update. Steps which own tasks override this.
  void update(const mesos::TaskStatus& status) override;

  // Default: ignores the parameters.
  void updateParameters(
      const std::map<std::string, std::string>& parameters) override;

  std::vector<Element*> restart() override;

  std::vector<Element*> forceComplete() override;

  bool hasConflicts(const hashset<std::string>& dirtyAssets) const override;

  /**
   * The asset this step works on, if any. Two steps working on the
   * same asset are never started concurrently across plans.
   */
  virtual Option<std::string> getAsset() const;

  /**
   * Performs or initiates the work of this step. Called by the offer
   * loop whenever the step is a candidate, so this must tolerate being
   * invoked repeatedly until the step leaves `PENDING`/`PREPARED`.
   */
  virtual void start() = 0;

protected:
  // Sets the status and returns the previous one. Observers are
  // notified only if the status actually changed.
  Status setStatus(const Status& status);

  // Records an error; any error turns the step's ancestors to `ERROR`
  // until the step is restarted or forced to complete.
  void addError(const std::string& error);

private:
  // Sets the status and drops the recorded errors. Returns whether
  // either changed.
  bool reset(const Status& status);

  const id::UUID id;
  const std::string name;

  mutable std::mutex mutex;
  Status status;
  bool interrupted;
  std::vector<std::string> errors;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_STEP_HPP__

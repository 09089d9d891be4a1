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

#ifndef __CONDUCTOR_PLAN_PHASE_HPP__
#define __CONDUCTOR_PLAN_PHASE_HPP__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <mesos/mesos.hpp>

#include <process/owned.hpp>

#include <stout/hashset.hpp>
#include <stout/uuid.hpp>

#include <conductor/plan/element.hpp>
#include <conductor/plan/observer.hpp>
#include <conductor/plan/parent_element.hpp>
#include <conductor/plan/status.hpp>
#include <conductor/plan/step.hpp>
#include <conductor/plan/strategy.hpp>

namespace conductor {
namespace plan {

// A named group of steps, worked on in the order chosen by its
// strategy. The status of a phase is derived from its steps.
class Phase : public Element, public ChainedObserver
{
public:
  Phase(
      const std::string& name,
      const std::vector<std::shared_ptr<Step>>& steps,
      const process::Owned<Strategy<Step>>& strategy =
        process::Owned<Strategy<Step>>(new SerialStrategy<Step>()),
      const std::vector<std::string>& errors = std::vector<std::string>());

  ~Phase() override;

  const std::vector<std::shared_ptr<Step>>& getChildren() const;

  Strategy<Step>& getStrategy() const;

  const id::UUID& getId() const override;
  const std::string& getName() const override;
  std::string getType() const override;
  Status getStatus() const override;
  std::vector<std::string> getErrors() const override;

  bool interrupt() override;
  bool proceed() override;
  bool isInterrupted() const override;

  void update(const mesos::TaskStatus& status) override;
  void updateParameters(
      const std::map<std::string, std::string>& parameters) override;

  std::vector<Element*> restart() override;
  std::vector<Element*> forceComplete() override;

  bool hasConflicts(const hashset<std::string>& dirtyAssets) const override;

private:
  const id::UUID id;
  const std::string name;
  ParentElement<Step> parent;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_PHASE_HPP__

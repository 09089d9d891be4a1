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

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <stout/foreach.hpp>

#include <conductor/plan/plan.hpp>

using process::Owned;

using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

namespace conductor {
namespace plan {

Plan::Plan(
    const string& _name,
    const vector<shared_ptr<Phase>>& phases,
    const Owned<Strategy<Phase>>& strategy,
    const vector<string>& errors)
  : id(id::UUID::random()),
    name(_name),
    parent(_name, phases, strategy, errors)
{
  foreach (const shared_ptr<Phase>& phase, parent.getChildren()) {
    phase->subscribe(this);
  }
}


Plan::~Plan()
{
  foreach (const shared_ptr<Phase>& phase, parent.getChildren()) {
    phase->unsubscribe(this);
  }
}


const vector<shared_ptr<Phase>>& Plan::getChildren() const
{
  return parent.getChildren();
}


Strategy<Phase>& Plan::getStrategy() const
{
  return parent.getStrategy();
}


const id::UUID& Plan::getId() const
{
  return id;
}


const string& Plan::getName() const
{
  return name;
}


string Plan::getType() const
{
  return "Plan";
}


Status Plan::getStatus() const
{
  return parent.getStatus();
}


vector<string> Plan::getErrors() const
{
  return parent.getErrors();
}


bool Plan::interrupt()
{
  const bool changed = parent.getStrategy().interrupt();
  notifyObservers();
  return changed;
}


bool Plan::proceed()
{
  const bool changed = parent.getStrategy().proceed();
  notifyObservers();
  return changed;
}


bool Plan::isInterrupted() const
{
  return parent.isInterrupted();
}


void Plan::update(const mesos::TaskStatus& status)
{
  parent.update(status);
}


void Plan::updateParameters(const map<string, string>& parameters)
{
  parent.updateParameters(parameters);
}


vector<Element*> Plan::restart()
{
  return parent.restart();
}


vector<Element*> Plan::forceComplete()
{
  return parent.forceComplete();
}


bool Plan::hasConflicts(const hashset<string>& dirtyAssets) const
{
  return parent.hasConflicts(dirtyAssets);
}

} // namespace plan {
} // namespace conductor {

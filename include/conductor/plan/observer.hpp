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

#ifndef __CONDUCTOR_PLAN_OBSERVER_HPP__
#define __CONDUCTOR_PLAN_OBSERVER_HPP__

#include <mutex>
#include <vector>

namespace conductor {
namespace plan {

// Forward declaration.
class Observable;


// Receives a synchronous callback whenever an `Observable` it is
// subscribed to changes.
class Observer
{
public:
  virtual ~Observer() {}

  virtual void updated(const Observable& observable) = 0;
};


// Keeps a list of subscribed observers and notifies them in
// subscription order. Observers are not owned and must unsubscribe
// before they are destroyed. Notification happens outside of the
// subscriber lock so that observers may call back into the observable.
class Observable
{
public:
  virtual ~Observable() {}

  void subscribe(Observer* observer);

  void unsubscribe(Observer* observer);

protected:
  void notifyObservers();

private:
  std::mutex mutex;
  std::vector<Observer*> observers;
};


// An observable which forwards every notification it receives from
// the observables it subscribes to. Parent elements use this to pass
// status changes of their children up the tree.
class ChainedObserver : public Observer, public Observable
{
public:
  void updated(const Observable& observable) override;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_OBSERVER_HPP__

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

#ifndef __UNINSTALL_SECRETS_HPP__
#define __UNINSTALL_SECRETS_HPP__

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace conductor {
namespace internal {
namespace uninstall {

// Access to the secret store holding the TLS artifacts of the service.
class SecretsClient
{
public:
  virtual ~SecretsClient() {}

  // Returns the names of the secrets stored in `ns`, relative to `ns`.
  virtual Try<std::vector<std::string>> list(const std::string& ns) = 0;

  // Removes the secret at `path`, i.e. `<namespace>/<name>`.
  virtual Try<Nothing> remove(const std::string& path) = 0;
};

} // namespace uninstall {
} // namespace internal {
} // namespace conductor {

#endif // __UNINSTALL_SECRETS_HPP__

/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include <uow/work_context.hxx>

namespace uow
{
    work_context::work_context(const context& base, const transaction_map& transactions)
      : base_(base)
      , transactions_(transactions)
    {
    }

    std::shared_ptr<transaction> work_context::find(const transactional& component) const
    {
        auto it = transactions_.find(coordination_key(component));
        if (it == transactions_.end()) {
            return nullptr;
        }
        return it->second;
    }
} // namespace uow

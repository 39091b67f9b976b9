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

#pragma once

#include <memory>

#include <uow/transaction.hxx>

namespace uow
{
    /**
     * @brief A resource capable of starting a transaction.
     *
     * A @ref unit_of_work calls begin at most once per run for each distinct coordination key.
     */
    class transactional
    {
      public:
        virtual ~transactional() = default;

        /**
         * Starts a transaction on this resource.
         *
         * @return the handle of the new transaction, never null.
         * @throws any exception to abort the unit of work.
         */
        virtual std::shared_ptr<transaction> begin() = 0;
    };

    /**
     * @brief Optional capability of a @ref transactional resource.
     *
     * Resources returning the same key share a single transaction: only the first of them in a
     * @ref unit_of_work is asked to begin, and every one of them sees that transaction during the run.
     * Typically the key is the address of the connection or session the resources have in common.
     */
    class context_provider
    {
      public:
        virtual ~context_provider() = default;

        virtual const void* context_key() const = 0;
    };

    /**
     * The key used to deduplicate transactions: the provided context key when the resource is a
     * @ref context_provider, the address of the resource otherwise.
     */
    const void* coordination_key(const transactional& component);
} // namespace uow

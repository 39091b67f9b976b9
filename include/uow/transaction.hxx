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

namespace uow
{
    /**
     * @brief One resource's in-flight transaction.
     *
     * Handles are created by @ref transactional::begin and driven by the @ref unit_of_work, which calls
     * exactly one of commit or rollback on success, or rollback after a failure.  Both report errors by
     * throwing.
     */
    class transaction
    {
      public:
        virtual ~transaction() = default;

        /**
         * Makes the work done under this transaction permanent.
         */
        virtual void commit() = 0;

        /**
         * Discards the work done under this transaction.
         *
         * Must be safe to call when commit was never attempted.  It may also be called after a successful
         * commit, when a later participant of the same unit of work failed to commit.  Implementations should
         * treat that as a no-op or best-effort cleanup: the unit of work cannot compensate a commit that
         * already happened.
         */
        virtual void rollback() = 0;
    };

    /**
     * @brief A transaction that does nothing.
     *
     * Lets resources without real transactional behaviour take part in a unit of work.
     */
    class nop_transaction : public transaction
    {
      public:
        void commit() override
        {
        }

        void rollback() override
        {
        }
    };
} // namespace uow

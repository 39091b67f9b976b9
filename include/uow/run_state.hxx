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

#include <stdexcept>
#include <string>

namespace uow
{
    /**
     * The states a unit of work goes through during a run.
     */
    enum class run_state {
        /**
         * No run happened yet.
         */
        IDLE,

        /**
         * Transactions are being started on the components.
         */
        BEGINNING,

        /**
         * The logic of the run is executing.
         */
        EXECUTING,

        /**
         * The logic succeeded, transactions are being committed.
         */
        COMMITTING,

        /**
         * Something failed, every begun transaction is being rolled back.
         */
        ROLLING_BACK,

        /**
         * Set once every transaction committed.
         */
        DONE,

        /**
         * Set once the rollback after a failure completed.
         */
        FAILED
    };

    inline const char* run_state_name(run_state state)
    {
        switch (state) {
            case run_state::IDLE:
                return "IDLE";
            case run_state::BEGINNING:
                return "BEGINNING";
            case run_state::EXECUTING:
                return "EXECUTING";
            case run_state::COMMITTING:
                return "COMMITTING";
            case run_state::ROLLING_BACK:
                return "ROLLING_BACK";
            case run_state::DONE:
                return "DONE";
            case run_state::FAILED:
                return "FAILED";
            default:
                throw std::runtime_error("unknown run state");
        }
    }

    inline bool is_running(run_state state)
    {
        return state == run_state::BEGINNING || state == run_state::EXECUTING || state == run_state::COMMITTING ||
               state == run_state::ROLLING_BACK;
    }
} // namespace uow

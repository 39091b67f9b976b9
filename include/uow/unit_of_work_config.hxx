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

#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <uow/support.hxx>

namespace uow
{
    /**
     * @brief A rollback which failed while cleaning up after a failed run.
     *
     * These never replace the error of the run; they are logged and passed to the
     * @ref unit_of_work_config::rollback_error_handler.
     */
    struct rollback_failure {
        /** Position of the transaction in begin order */
        std::size_t index;
        /** Demangled type of the component which began the transaction */
        std::string component;
        std::string message;
        std::exception_ptr error;
    };

    /**
     * Tunables for a unit of work.
     */
    class unit_of_work_config
    {
      public:
        typedef std::function<void(const rollback_failure&)> rollback_error_handler_type;

        unit_of_work_config();

        /**
         * @brief Name of the unit of work in log messages.
         */
        UOW_NODISCARD const std::string& label() const
        {
            return label_;
        }

        void label(const std::string& label)
        {
            label_ = label;
        }

        /**
         * @brief Called for each rollback which throws while a run is being rolled back.
         */
        UOW_NODISCARD const rollback_error_handler_type& rollback_error_handler() const
        {
            return rollback_error_handler_;
        }

        void rollback_error_handler(rollback_error_handler_type handler)
        {
            rollback_error_handler_ = std::move(handler);
        }

      private:
        std::string label_;
        rollback_error_handler_type rollback_error_handler_;
    };
} // namespace uow

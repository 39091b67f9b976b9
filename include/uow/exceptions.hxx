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

#include <exception>
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace uow
{
    /**
     * @brief Base class for the errors raised by the unit of work itself.
     *
     * Errors raised by resources (from begin, commit) or by the logic of a run are not wrapped: @ref
     * unit_of_work::run rethrows them unchanged.
     */
    class uow_exception : public std::runtime_error
    {
      public:
        explicit uow_exception(const std::string& what)
          : std::runtime_error(what)
        {
        }
    };

    /**
     * @brief A candidate component does not implement @ref transactional.
     *
     * Raised while creating a @ref unit_of_work.
     */
    class not_transactional : public uow_exception
    {
      private:
        std::string type_name_;

      public:
        explicit not_transactional(const std::string& type_name)
          : uow_exception("cannot create unit of work: component " + type_name + " does not implement uow::transactional")
          , type_name_(type_name)
        {
        }

        /**
         * @brief Demangled type of the rejected component.
         */
        const std::string& type_name() const
        {
            return type_name_;
        }
    };

    /**
     * @brief Something which is not a std::exception was thrown during a run.
     *
     * The message is "recovered: " followed by the text of the thrown value.
     */
    class recovered_panic : public uow_exception
    {
      public:
        explicit recovered_panic(const std::string& payload)
          : uow_exception("recovered: " + payload)
        {
        }
    };

    /**
     * @brief Human readable name of a type.
     */
    std::string demangled_name(const std::type_info& info);

    /**
     * @brief Normalize a caught exception.
     *
     * Exceptions deriving from std::exception are returned unchanged, anything else is converted into a
     * @ref recovered_panic.
     */
    std::exception_ptr recover(std::exception_ptr err);
} // namespace uow

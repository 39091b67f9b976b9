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
#include <type_traits>
#include <unordered_map>

#include <uow/context.hxx>
#include <uow/support.hxx>
#include <uow/transactional.hxx>

namespace uow
{
    /**
     * @brief What the logic of a run sees of its unit of work.
     *
     * Maps each component, given by shared_ptr, raw pointer or reference, to the context its operations
     * should use.  The context carries the transaction begun for the component's coordination key, on top
     * of the base context given to the run.  Anything else - a component which is not part of the unit of work, an object which is not
     * @ref transactional, a null pointer - maps to a context without transaction, and the component is
     * expected to fall back to its non-transactional behaviour.
     */
    class work_context
    {
      public:
        typedef std::unordered_map<const void*, std::shared_ptr<transaction>> transaction_map;

        work_context(const context& base, const transaction_map& transactions);

        template<typename T>
        UOW_NODISCARD context context_for(const std::shared_ptr<T>& component) const
        {
            if (!component) {
                return base_.with_transaction(nullptr);
            }
            return context_for(*component);
        }

        template<typename T>
        UOW_NODISCARD context context_for(T* component) const
        {
            if (component == nullptr) {
                return base_.with_transaction(nullptr);
            }
            return context_for(*component);
        }

        template<typename T>
        UOW_NODISCARD context context_for(const T& component) const
        {
            return base_.with_transaction(transaction_for(component));
        }

        template<typename T>
        UOW_NODISCARD std::shared_ptr<transaction> transaction_for(const std::shared_ptr<T>& component) const
        {
            if (!component) {
                return nullptr;
            }
            return transaction_for(*component);
        }

        template<typename T>
        UOW_NODISCARD std::shared_ptr<transaction> transaction_for(T* component) const
        {
            if (component == nullptr) {
                return nullptr;
            }
            return transaction_for(*component);
        }

        template<typename T>
        UOW_NODISCARD std::shared_ptr<transaction> transaction_for(const T& component) const
        {
            if constexpr (std::is_base_of_v<transactional, T>) {
                return find(static_cast<const transactional&>(component));
            } else if constexpr (std::is_polymorphic_v<T>) {
                auto* t = dynamic_cast<const transactional*>(&component);
                return t == nullptr ? nullptr : find(*t);
            } else {
                return nullptr;
            }
        }

        UOW_NODISCARD const context& base() const
        {
            return base_;
        }

      private:
        std::shared_ptr<transaction> find(const transactional& component) const;

        const context& base_;
        const transaction_map& transactions_;
    };
} // namespace uow

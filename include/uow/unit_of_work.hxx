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

#include <functional>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <uow/context.hxx>
#include <uow/exceptions.hxx>
#include <uow/run_result.hxx>
#include <uow/run_state.hxx>
#include <uow/support.hxx>
#include <uow/transaction.hxx>
#include <uow/transactional.hxx>
#include <uow/unit_of_work_config.hxx>
#include <uow/work_context.hxx>

namespace uow
{
    /** @brief The logic of a run should be contained in a lambda of this form */
    typedef std::function<void(work_context&)> logic;

    /**
     * @mainpage
     * A unit of work groups components which each manage their own transactions - repositories, caches,
     * queues - and runs a lambda over them as a single all-or-nothing step.  The lambda gets a
     * @ref work_context which hands out the context every component operation should use.  For example:
     *
     * @code{.cpp}
     * auto orders = std::make_shared<order_repository>(db);
     * auto stock = std::make_shared<stock_cache>(redis);
     * auto work = uow::unit_of_work::create(orders, stock);
     *
     * try {
     *     work.run([&](uow::work_context& ctx) {
     *         orders->insert(ctx.context_for(orders), order);
     *         stock->decrement(ctx.context_for(stock), order.item, order.quantity);
     *     });
     * } catch (const std::exception& e) {
     *     std::cerr << "order failed, nothing was written: " << e.what() << std::endl;
     * }
     * @endcode
     *
     * Commits happen one after the other in the order the transactions were begun.  This is not a
     * two-phase commit: when a commit fails after others succeeded, the committed transactions are
     * rolled back too, but whether that undoes anything is up to each component.
     *
     * For a more detailed example, see @ref examples/account_transfer.cxx
     *
     * @example examples/account_transfer.cxx
     */
    class unit_of_work
    {
      public:
        /**
         * @brief Create a unit of work from arbitrary components.
         *
         * Each component must implement @ref transactional.  This is checked at compile time when it can
         * be, and with a dynamic cast otherwise.
         *
         * @param components The components taking part in the unit of work, in begin order.
         * @throws not_transactional naming the type of the first component which isn't transactional.
         */
        template<typename... Components>
        static unit_of_work create(const std::shared_ptr<Components>&... components)
        {
            std::vector<std::shared_ptr<transactional>> validated;
            validated.reserve(sizeof...(Components));
            (validated.push_back(as_transactional(components)), ...);
            return unit_of_work(std::move(validated));
        }

        /**
         * @brief Create a unit of work from components known to be transactional.
         *
         * @param components The components taking part in the unit of work, in begin order.
         * @param config The configuration parameters to use for the runs.
         * @throws uow_exception if a component is null.
         */
        explicit unit_of_work(std::vector<std::shared_ptr<transactional>> components,
                              const unit_of_work_config& config = unit_of_work_config());

        /**
         * @brief Run the logic as one unit of work
         *
         * Begins a transaction for every distinct coordination key, calls the lambda, then commits every
         * transaction.  If beginning, the lambda or a commit throws, every begun transaction is rolled back
         * and the original exception is rethrown.  Values thrown which are not std::exception are turned
         * into @ref recovered_panic.
         *
         * @param logic The lambda containing the operations.
         * @return Some information about the run.
         */
        run_result run(const logic& logic);

        /**
         * @brief Run the logic as one unit of work, deriving the component contexts from the given one.
         *
         * Deadline and cancellation of the base context are passed on to the components; the unit of work
         * doesn't act on them itself.
         */
        run_result run(const context& base, const logic& logic);

        /**
         * @brief Return reference to @ref unit_of_work_config.
         *
         * @return config for this unit of work.
         */
        UOW_NODISCARD unit_of_work_config& config()
        {
            return config_;
        }

        UOW_NODISCARD const std::vector<std::shared_ptr<transactional>>& components() const
        {
            return components_;
        }

        UOW_NODISCARD run_state state() const
        {
            return state_;
        }

      private:
        template<typename T>
        static std::shared_ptr<transactional> as_transactional(const std::shared_ptr<T>& component)
        {
            if (!component) {
                throw uow_exception("cannot create unit of work: component " + demangled_name(typeid(T)) + " is null");
            }
            if constexpr (std::is_base_of_v<transactional, T>) {
                return component;
            } else if constexpr (std::is_polymorphic_v<T>) {
                if (auto t = std::dynamic_pointer_cast<transactional>(component)) {
                    return t;
                }
                throw not_transactional(demangled_name(typeid(*component)));
            } else {
                throw not_transactional(demangled_name(typeid(T)));
            }
        }

        std::vector<std::shared_ptr<transactional>> components_;
        unit_of_work_config config_;
        work_context::transaction_map contexts_;
        run_state state_{ run_state::IDLE };
    };
} // namespace uow

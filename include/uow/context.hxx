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

#include <atomic>
#include <chrono>
#include <memory>

#include <boost/optional.hpp>
#include <uow/support.hxx>
#include <uow/transaction.hxx>

namespace uow
{
    /**
     * @brief Execution context handed to resource operations.
     *
     * Carries the deadline and cancellation state of the caller, plus the transaction a resource should
     * use.  Contexts are cheap immutable values: the with_* functions return derived copies, and every
     * copy shares the cancellation state of the context it came from.
     *
     * A default constructed context has no deadline, cannot be cancelled and carries no transaction.
     */
    class context
    {
      public:
        typedef std::chrono::steady_clock clock;

        context() = default;

        /**
         * @brief Derive a context which expires at the given time point.
         *
         * The derived deadline is the earlier of this one and the requested one.
         */
        UOW_NODISCARD context with_deadline(clock::time_point deadline) const;

        /**
         * Deadline @p duration from now.  Timeouts past the range of the clock saturate to
         * clock::time_point::max() (or min() for negative ones).
         */
        template<typename T>
        UOW_NODISCARD context with_timeout(T duration) const
        {
            typedef std::chrono::duration<double> seconds;
            auto now = clock::now();
            auto target = seconds(now.time_since_epoch()) + seconds(duration);
            if (target >= seconds(clock::duration::max())) {
                return with_deadline(clock::time_point::max());
            }
            if (target <= seconds(clock::duration::min())) {
                return with_deadline(clock::time_point::min());
            }
            return with_deadline(now + std::chrono::duration_cast<clock::duration>(duration));
        }

        /**
         * @brief Derive a context which can be cancelled on its own.
         *
         * Cancelling the derived context leaves this one untouched; cancelling this one (if it is
         * cancellable) cancels the derived one too.
         */
        UOW_NODISCARD context with_cancellation() const;

        /**
         * @brief Derive a context carrying the given transaction.
         *
         * Pass nullptr for a context without transaction.
         */
        UOW_NODISCARD context with_transaction(std::shared_ptr<uow::transaction> txn) const;

        /**
         * Cancel this context and all contexts derived from it.  Does nothing on a context not made by
         * @ref with_cancellation (or derived from one).
         */
        void cancel() const;

        UOW_NODISCARD bool cancelled() const;

        UOW_NODISCARD bool expired() const;

        UOW_NODISCARD bool done() const
        {
            return cancelled() || expired();
        }

        UOW_NODISCARD const boost::optional<clock::time_point>& deadline() const
        {
            return deadline_;
        }

        /**
         * Time left before the deadline, zero if it has passed, and clock::duration::max() without deadline.
         */
        UOW_NODISCARD clock::duration remaining() const;

        UOW_NODISCARD const std::shared_ptr<uow::transaction>& transaction() const
        {
            return transaction_;
        }

        UOW_NODISCARD bool has_transaction() const
        {
            return static_cast<bool>(transaction_);
        }

        /**
         * The carried transaction as the concrete handle type of a resource, or nullptr when there is no
         * transaction or it is of another type.
         */
        template<typename T>
        UOW_NODISCARD std::shared_ptr<T> transaction_as() const
        {
            return std::dynamic_pointer_cast<T>(transaction_);
        }

      private:
        struct cancellation {
            std::atomic<bool> cancelled{ false };
            std::shared_ptr<const cancellation> parent;
        };

        boost::optional<clock::time_point> deadline_;
        std::shared_ptr<cancellation> cancellation_;
        std::shared_ptr<uow::transaction> transaction_;
    };
} // namespace uow

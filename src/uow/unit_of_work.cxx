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

#include "logging.hxx"
#include "uid_generator.hxx"
#include <uow/unit_of_work.hxx>

#include <utility>

namespace uow
{
    namespace
    {
        const std::string run_format_string("[{}/{}]: ");

        struct begun_transaction {
            std::shared_ptr<transaction> txn;
            std::shared_ptr<transactional> component;
        };

        /**
         * Log prefix of one run.  Releases the transactions of the run when it goes out of scope, whatever the
         * outcome.
         */
        class run_scope
        {
          public:
            run_scope(const std::string& label, work_context::transaction_map& contexts)
              : label_(label)
              , run_id_(uid_generator::next())
              , contexts_(contexts)
            {
            }

            ~run_scope()
            {
                contexts_.clear();
            }

            run_scope(const run_scope&) = delete;
            run_scope& operator=(const run_scope&) = delete;

            const std::string& run_id() const
            {
                return run_id_;
            }

            template<typename... Args>
            void trace(const std::string& fmt, Args&&... args) const
            {
                uow_log->trace(fmt::runtime(run_format_string + fmt), label_, run_id_, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void debug(const std::string& fmt, Args&&... args) const
            {
                uow_log->debug(fmt::runtime(run_format_string + fmt), label_, run_id_, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void warn(const std::string& fmt, Args&&... args) const
            {
                uow_log->warn(fmt::runtime(run_format_string + fmt), label_, run_id_, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void error(const std::string& fmt, Args&&... args) const
            {
                uow_log->error(fmt::runtime(run_format_string + fmt), label_, run_id_, std::forward<Args>(args)...);
            }

          private:
            const std::string& label_;
            const std::string run_id_;
            work_context::transaction_map& contexts_;
        };

        std::string type_of(const transactional& component)
        {
            return demangled_name(typeid(component));
        }

        // err always holds a std::exception once it went through recover()
        std::string describe(const std::exception_ptr& err)
        {
            try {
                std::rethrow_exception(err);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown exception";
            }
        }

        void notify_rollback_failure(const run_scope& scope, const unit_of_work_config& config, const rollback_failure& failure)
        {
            // copied, the handler may replace itself in the config
            auto handler = config.rollback_error_handler();
            if (!handler) {
                return;
            }
            try {
                handler(failure);
            } catch (const std::exception& e) {
                scope.error("rollback error handler threw {}", e.what());
            } catch (...) {
                scope.error("rollback error handler threw an unknown exception");
            }
        }

        void rollback_all(const run_scope& scope, const std::vector<begun_transaction>& begun, const unit_of_work_config& config)
        {
            for (std::size_t i = 0; i < begun.size(); ++i) {
                try {
                    begun[i].txn->rollback();
                    scope.trace("rolled back transaction {} of {}", i, type_of(*begun[i].component));
                } catch (...) {
                    auto err = recover(std::current_exception());
                    rollback_failure failure{ i, type_of(*begun[i].component), describe(err), err };
                    scope.warn("rollback of transaction {} of {} failed, continuing: {}", i, failure.component, failure.message);
                    notify_rollback_failure(scope, config, failure);
                }
            }
        }
    } // namespace

    unit_of_work::unit_of_work(std::vector<std::shared_ptr<transactional>> components, const unit_of_work_config& config)
      : components_(std::move(components))
      , config_(config)
    {
        for (const auto& component : components_) {
            if (!component) {
                throw uow_exception("cannot create unit of work: component is null");
            }
        }
        contexts_.reserve(components_.size());
        uow_log->debug("[{}]: created unit of work over {} components", config_.label(), components_.size());
    }

    run_result unit_of_work::run(const logic& logic)
    {
        return run(context(), logic);
    }

    run_result unit_of_work::run(const context& base, const logic& logic)
    {
        if (is_running(state_)) {
            throw uow_exception("unit of work is already running");
        }
        run_scope scope(config_.label(), contexts_);
        std::vector<begun_transaction> begun;
        begun.reserve(components_.size());
        std::exception_ptr failure;

        state_ = run_state::BEGINNING;
        scope.debug("beginning transactions for {} components", components_.size());
        try {
            for (const auto& component : components_) {
                const void* key = coordination_key(*component);
                if (contexts_.count(key) > 0) {
                    // an earlier component shares this key, and its transaction
                    scope.trace("{} shares an already begun transaction", type_of(*component));
                    continue;
                }
                auto txn = component->begin();
                if (!txn) {
                    throw uow_exception("cannot begin transaction: component " + type_of(*component) + " returned no transaction");
                }
                contexts_.emplace(key, txn);
                begun.push_back({ txn, component });
                scope.trace("began transaction {} for {}", begun.size() - 1, type_of(*component));
            }
        } catch (...) {
            failure = recover(std::current_exception());
            scope.error("begin failed after {} transactions: {}", begun.size(), describe(failure));
        }

        if (!failure) {
            state_ = run_state::EXECUTING;
            try {
                work_context ctx(base, contexts_);
                logic(ctx);
            } catch (...) {
                failure = recover(std::current_exception());
                scope.error("logic failed: {}", describe(failure));
            }
        }

        if (!failure) {
            state_ = run_state::COMMITTING;
            for (std::size_t i = 0; i < begun.size(); ++i) {
                try {
                    begun[i].txn->commit();
                    scope.trace("committed transaction {} of {}", i, type_of(*begun[i].component));
                } catch (...) {
                    failure = recover(std::current_exception());
                    scope.error("commit of transaction {} of {} failed: {}", i, type_of(*begun[i].component), describe(failure));
                    break;
                }
            }
        }

        if (failure) {
            state_ = run_state::ROLLING_BACK;
            scope.debug("rolling back {} transactions", begun.size());
            rollback_all(scope, begun, config_);
            state_ = run_state::FAILED;
            scope.debug("{} after rolling back {} transactions", run_state_name(state_), begun.size());
            std::rethrow_exception(failure);
        }

        state_ = run_state::DONE;
        scope.debug("{} after committing {} transactions", run_state_name(state_), begun.size());
        return run_result{ scope.run_id(), components_.size(), begun.size() };
    }
} // namespace uow

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

#include <uow/unit_of_work.hxx>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * Records every begin/commit/rollback so tests can check the order of calls across components.
 */
struct journal {
    std::vector<std::string> entries;

    void add(const std::string& entry)
    {
        entries.push_back(entry);
    }
};

struct fake_transaction : public uow::transaction {
    std::string name;
    std::string value;
    std::shared_ptr<journal> log;
    std::exception_ptr commit_error;
    std::exception_ptr rollback_error;
    int commits{ 0 };
    int rollbacks{ 0 };

    fake_transaction(std::string n, std::string v, std::shared_ptr<journal> j)
      : name(std::move(n))
      , value(std::move(v))
      , log(std::move(j))
    {
    }

    void commit() override
    {
        ++commits;
        log->add("commit " + name);
        if (commit_error) {
            std::rethrow_exception(commit_error);
        }
    }

    void rollback() override
    {
        ++rollbacks;
        log->add("rollback " + name);
        if (rollback_error) {
            std::rethrow_exception(rollback_error);
        }
    }

    bool committed() const
    {
        return commits > 0;
    }

    bool rolled_back() const
    {
        return rollbacks > 0;
    }
};

/**
 * A repository-like component.  Its operation returns the value of the transaction found in the context,
 * or its own value outside a transaction.
 */
class fake_component : public uow::transactional
{
  public:
    fake_component(const std::string& name, std::shared_ptr<journal> j)
      : name_(name)
      , value_(name)
      , log_(std::move(j))
      , txn_(std::make_shared<fake_transaction>(name, "tx " + name, log_))
    {
    }

    std::shared_ptr<uow::transaction> begin() override
    {
        ++begins_;
        log_->add("begin " + name_);
        if (begin_error_) {
            std::rethrow_exception(begin_error_);
        }
        return txn_;
    }

    std::string operation(const uow::context& ctx) const
    {
        if (panic_) {
            throw std::string(*panic_);
        }
        std::string val = value_;
        if (auto txn = ctx.transaction_as<fake_transaction>()) {
            val = txn->value;
        }
        if (error_) {
            std::rethrow_exception(error_);
        }
        return val;
    }

    void fail_begin(const std::string& message)
    {
        begin_error_ = std::make_exception_ptr(std::runtime_error(message));
    }

    void fail_operation(const std::string& message)
    {
        error_ = std::make_exception_ptr(std::runtime_error(message));
    }

    void panic_in_operation(const std::string& payload)
    {
        panic_ = std::make_shared<std::string>(payload);
    }

    fake_transaction& txn()
    {
        return *txn_;
    }

    int begins() const
    {
        return begins_;
    }

  private:
    std::string name_;
    std::string value_;
    std::shared_ptr<journal> log_;
    std::shared_ptr<fake_transaction> txn_;
    std::exception_ptr begin_error_;
    std::exception_ptr error_;
    std::shared_ptr<std::string> panic_;
    int begins_{ 0 };
};

/**
 * Component living on a shared session: every component built on the same session shares its transaction.
 */
class session_component
  : public fake_component
  , public uow::context_provider
{
  public:
    session_component(const std::string& name, std::shared_ptr<journal> j, const void* session)
      : fake_component(name, std::move(j))
      , session_(session)
    {
    }

    const void* context_key() const override
    {
        return session_;
    }

  private:
    const void* session_;
};

/**
 * A component which always hands out the no-op transaction.
 */
class nop_component : public uow::transactional
{
  public:
    std::shared_ptr<uow::transaction> begin() override
    {
        return std::make_shared<uow::nop_transaction>();
    }
};

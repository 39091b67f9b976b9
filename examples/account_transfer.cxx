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

#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <uow/logging.hxx>
#include <uow/unit_of_work.hxx>

using namespace std;

/**
 * A toy storage session: balances plus a list of transfer records.  A transaction works on a copy of the
 * state and swaps it in on commit.
 */
class ledger_session
{
  public:
    struct state {
        map<string, int> balances;
        vector<string> transfers;
    };

    class txn : public uow::transaction
    {
      public:
        explicit txn(ledger_session& session)
          : session_(session)
          , working_(session.committed_)
        {
        }

        void commit() override
        {
            session_.committed_ = working_;
            committed_ = true;
        }

        void rollback() override
        {
            // after a commit there is nothing left to undo here
            if (!committed_) {
                working_ = session_.committed_;
            }
        }

        state& working()
        {
            return working_;
        }

      private:
        ledger_session& session_;
        state working_;
        bool committed_{ false };
    };

    state& committed()
    {
        return committed_;
    }

  private:
    state committed_;
};

/**
 * Both repositories live on the same session, so they share its transaction.
 */
class ledger_repository
  : public uow::transactional
  , public uow::context_provider
{
  public:
    explicit ledger_repository(shared_ptr<ledger_session> session)
      : session_(std::move(session))
    {
    }

    shared_ptr<uow::transaction> begin() override
    {
        return make_shared<ledger_session::txn>(*session_);
    }

    const void* context_key() const override
    {
        return session_.get();
    }

  protected:
    ledger_session::state& state_for(const uow::context& ctx)
    {
        if (auto t = ctx.transaction_as<ledger_session::txn>()) {
            return t->working();
        }
        return session_->committed();
    }

  private:
    shared_ptr<ledger_session> session_;
};

class account_repository : public ledger_repository
{
  public:
    using ledger_repository::ledger_repository;

    void add(const uow::context& ctx, const string& account, int amount)
    {
        auto& balances = state_for(ctx).balances;
        if (balances[account] + amount < 0) {
            throw runtime_error("insufficient funds in " + account);
        }
        balances[account] += amount;
    }

    int balance(const uow::context& ctx, const string& account)
    {
        return state_for(ctx).balances[account];
    }
};

class transfer_repository : public ledger_repository
{
  public:
    using ledger_repository::ledger_repository;

    void record(const uow::context& ctx, const string& line)
    {
        state_for(ctx).transfers.push_back(line);
    }

    size_t count(const uow::context& ctx)
    {
        return state_for(ctx).transfers.size();
    }
};

/**
 * Not transactional at all: takes part through a no-op transaction.
 */
class audit_cache : public uow::transactional
{
  public:
    shared_ptr<uow::transaction> begin() override
    {
        return make_shared<uow::nop_transaction>();
    }

    void note(const string& line)
    {
        cout << "audit: " << line << endl;
    }
};

class bank
{
  private:
    shared_ptr<account_repository> accounts_;
    shared_ptr<transfer_repository> transfers_;
    shared_ptr<audit_cache> audit_;
    uow::unit_of_work work_;

  public:
    explicit bank(const shared_ptr<ledger_session>& session)
      : accounts_(make_shared<account_repository>(session))
      , transfers_(make_shared<transfer_repository>(session))
      , audit_(make_shared<audit_cache>())
      , work_(uow::unit_of_work::create(accounts_, transfers_, audit_))
    {
        work_.config().label("bank");
    }

    void deposit(const string& account, int amount)
    {
        work_.run([&](uow::work_context& ctx) { accounts_->add(ctx.context_for(accounts_), account, amount); });
    }

    void transfer(const string& from, const string& to, int amount)
    {
        work_.run([&](uow::work_context& ctx) {
            // credit first, so a failing debit has something to roll back
            accounts_->add(ctx.context_for(accounts_), to, amount);
            accounts_->add(ctx.context_for(accounts_), from, -amount);
            transfers_->record(ctx.context_for(transfers_), from + " -> " + to + ": " + to_string(amount));
            audit_->note("transfer of " + to_string(amount) + " from " + from + " to " + to);
        });
    }

    void report()
    {
        uow::context outside;
        cout << "alice=" << accounts_->balance(outside, "alice") << " bob=" << accounts_->balance(outside, "bob")
             << " transfers=" << transfers_->count(outside) << endl;
    }
};

int
main()
{
    uow::set_uow_log_level(uow::log_level::DEBUG);
    auto session = make_shared<ledger_session>();
    bank b(session);

    b.deposit("alice", 100);
    b.transfer("alice", "bob", 30);
    b.report();

    try {
        b.transfer("alice", "bob", 500);
    } catch (const exception& e) {
        cout << "transfer failed: " << e.what() << endl;
    }
    // unchanged: the credit to bob was rolled back with the failed debit
    b.report();
    return 0;
}

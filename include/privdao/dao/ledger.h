// PrivDAO - Value Ledger and Treasury Gateway
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// External collaborators of the governance core: the token-balance source
// used for voting weight and the gateway that moves treasury value once
// execution is authorized. ValueLedger is a persisted native and token
// balance ledger that backs both for a self-contained deployment.

#ifndef PRIVDAO_DAO_LEDGER_H
#define PRIVDAO_DAO_LEDGER_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"
#include "privdao/dao/state_store.h"

namespace privdao {
namespace dao {

// ============================================================================
// Interfaces
// ============================================================================

/**
 * Source of raw governance-token balances. Read once per commit or
 * delegation; weights are never re-read afterwards.
 */
class IBalanceSource {
public:
    virtual ~IBalanceSource() = default;

    virtual Result GetTokenBalance(const Identity& owner, const Identity& token,
                                   Amount& balance) = 0;
};

/// An authorized transfer out of a DAO treasury
struct TreasuryTransfer {
    Hash256 dao;
    Hash256 proposal;
    Identity treasury;
    TreasuryAction action;
};

/**
 * Performs the value movement of an executed proposal. Called at most once
 * per proposal, after the proposal has been marked executed.
 */
class ITreasuryGateway {
public:
    virtual ~ITreasuryGateway() = default;

    virtual Result Transfer(const TreasuryTransfer& transfer) = 0;
};

// ============================================================================
// Value Ledger
// ============================================================================

class ValueLedger {
public:
    static Result GetBalance(const Transaction& tx, const Identity& account, Amount& out);

    static Result GetTokenBalance(const Transaction& tx, const Identity& account,
                                  const Identity& token, Amount& out);

    static Result Credit(Transaction& tx, const Identity& account, Amount amount);

    /// INSUFFICIENT_FUNDS if the account holds less than amount
    static Result Debit(Transaction& tx, const Identity& account, Amount amount);

    static Result CreditToken(Transaction& tx, const Identity& account,
                              const Identity& token, Amount amount);

    static Result DebitToken(Transaction& tx, const Identity& account,
                             const Identity& token, Amount amount);

    static Result Transfer(Transaction& tx, const Identity& from, const Identity& to,
                           Amount amount);

    static Result TransferToken(Transaction& tx, const Identity& from, const Identity& to,
                                const Identity& token, Amount amount);
};

/// Committed token balances from the value ledger
class LedgerBalanceSource : public IBalanceSource {
public:
    explicit LedgerBalanceSource(StateStore& store) : store_(store) {}

    Result GetTokenBalance(const Identity& owner, const Identity& token,
                           Amount& balance) override;

private:
    StateStore& store_;
};

/// Treasury transfers applied to the value ledger in their own transaction
class LedgerTreasuryGateway : public ITreasuryGateway {
public:
    explicit LedgerTreasuryGateway(StateStore& store) : store_(store) {}

    Result Transfer(const TreasuryTransfer& transfer) override;

private:
    StateStore& store_;
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_LEDGER_H

// PrivDAO - Value Ledger and Treasury Gateway
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/ledger.h"
#include "privdao/core/serialize.h"
#include "privdao/dao/arith.h"
#include "privdao/util/logging.h"

namespace privdao {
namespace dao {

namespace {

std::string NativeKey(const Identity& account) {
    return RecordKey(db::prefix::NATIVE_BALANCE, account);
}

std::string TokenKey(const Identity& account, const Identity& token) {
    std::string key = RecordKey(db::prefix::TOKEN_BALANCE, account);
    key.append(reinterpret_cast<const char*>(token.data()), token.size());
    return key;
}

Result ReadAmount(const Transaction& tx, const std::string& key, Amount& out) {
    std::optional<std::string> raw;
    Result r = tx.Get(key, raw);
    if (!r.ok()) return r;
    if (!raw) {
        out = 0;
        return Result::Ok();
    }
    if (raw->size() != 8) {
        return Result::Error(DaoError::CORRUPT_RECORD, "bad balance entry");
    }
    DataStream ss(*raw);
    out = ser_readdata64(ss);
    return Result::Ok();
}

void WriteAmount(Transaction& tx, const std::string& key, Amount amount) {
    DataStream ss;
    ser_writedata64(ss, amount);
    tx.Put(key, ss.Str());
}

Result AddTo(Transaction& tx, const std::string& key, Amount amount) {
    Amount balance;
    Result r = ReadAmount(tx, key, balance);
    if (!r.ok()) return r;
    Amount updated;
    if (!CheckedAdd(balance, amount, updated)) {
        return Result::Error(DaoError::OVERFLOW, "balance overflow");
    }
    WriteAmount(tx, key, updated);
    return Result::Ok();
}

Result SubtractFrom(Transaction& tx, const std::string& key, Amount amount) {
    Amount balance;
    Result r = ReadAmount(tx, key, balance);
    if (!r.ok()) return r;
    if (balance < amount) {
        return Result::Error(DaoError::INSUFFICIENT_FUNDS,
                             "balance " + std::to_string(balance) + " below " +
                             std::to_string(amount));
    }
    WriteAmount(tx, key, balance - amount);
    return Result::Ok();
}

} // namespace

// ============================================================================
// ValueLedger
// ============================================================================

Result ValueLedger::GetBalance(const Transaction& tx, const Identity& account, Amount& out) {
    return ReadAmount(tx, NativeKey(account), out);
}

Result ValueLedger::GetTokenBalance(const Transaction& tx, const Identity& account,
                                    const Identity& token, Amount& out) {
    return ReadAmount(tx, TokenKey(account, token), out);
}

Result ValueLedger::Credit(Transaction& tx, const Identity& account, Amount amount) {
    return AddTo(tx, NativeKey(account), amount);
}

Result ValueLedger::Debit(Transaction& tx, const Identity& account, Amount amount) {
    return SubtractFrom(tx, NativeKey(account), amount);
}

Result ValueLedger::CreditToken(Transaction& tx, const Identity& account,
                                const Identity& token, Amount amount) {
    return AddTo(tx, TokenKey(account, token), amount);
}

Result ValueLedger::DebitToken(Transaction& tx, const Identity& account,
                               const Identity& token, Amount amount) {
    return SubtractFrom(tx, TokenKey(account, token), amount);
}

Result ValueLedger::Transfer(Transaction& tx, const Identity& from, const Identity& to,
                             Amount amount) {
    Result r = Debit(tx, from, amount);
    if (!r.ok()) return r;
    return Credit(tx, to, amount);
}

Result ValueLedger::TransferToken(Transaction& tx, const Identity& from, const Identity& to,
                                  const Identity& token, Amount amount) {
    Result r = DebitToken(tx, from, token, amount);
    if (!r.ok()) return r;
    return CreditToken(tx, to, token, amount);
}

// ============================================================================
// LedgerBalanceSource
// ============================================================================

Result LedgerBalanceSource::GetTokenBalance(const Identity& owner, const Identity& token,
                                            Amount& balance) {
    Transaction tx(store_);
    return ValueLedger::GetTokenBalance(tx, owner, token, balance);
}

// ============================================================================
// LedgerTreasuryGateway
// ============================================================================

Result LedgerTreasuryGateway::Transfer(const TreasuryTransfer& transfer) {
    const TreasuryAction& action = transfer.action;
    Transaction tx(store_);
    Result r;

    switch (action.type) {
        case TreasuryActionType::SendSol:
            r = ValueLedger::Transfer(tx, transfer.treasury, action.recipient, action.amount);
            break;

        case TreasuryActionType::SendToken:
            if (!action.tokenMint) {
                return Result::Error(DaoError::TOKEN_MINT_REQUIRED, "SendToken without token");
            }
            r = ValueLedger::TransferToken(tx, transfer.treasury, action.recipient,
                                           *action.tokenMint, action.amount);
            break;

        case TreasuryActionType::CustomCPI:
            LOG_INFO(util::LogCategory::TREASURY)
                << "relaying custom call to " << action.recipient.ToHex();
            return Result::Ok();
    }
    if (!r.ok()) return r;

    r = tx.Commit();
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TREASURY)
        << TreasuryActionTypeToString(action.type) << " " << action.amount
        << " to " << action.recipient.ToHex();
    return Result::Ok();
}

} // namespace dao
} // namespace privdao

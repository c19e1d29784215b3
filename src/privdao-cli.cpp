// PrivDAO - Command-Line Tool
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Operator front end for a local PrivDAO state directory.
// Supports:
// - Member key generation and identity display
// - DAO creation and migration
// - Proposal creation, cancellation and veto
// - Commit, delegate and reveal of private ballots
// - Finalization, execution and treasury deposits
// - Voter-weight sync and state inspection

#include <privdao/core/hex.h>
#include <privdao/core/random.h>
#include <privdao/crypto/keys.h>
#include <privdao/dao/address.h>
#include <privdao/dao/engine.h>
#include <privdao/dao/options.h>
#include <privdao/db/database.h>
#include <privdao/util/config.h>
#include <privdao/util/logging.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace privdao;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_KEY_FILE = "member.key";
constexpr const char* STATE_DIR = "state";
constexpr const char* SALT_DIR = "salts";
constexpr const char* LOG_FILE = "debug.log";

// ============================================================================
// Invocation
// ============================================================================

struct Invocation {
    util::ConfigManager config;
    std::vector<std::string> args;
    fs::path dataDir;
    Timestamp now{0};
    Slot slot{0};

    const std::string& Arg(size_t i) const {
        static const std::string empty;
        return i < args.size() ? args[i] : empty;
    }
};

// ============================================================================
// Parsing Utilities
// ============================================================================

std::optional<Identity> ParseIdentity(const std::string& hex) {
    std::array<Byte, 32> bytes;
    if (!ParseFixedHex(hex, bytes)) {
        return std::nullopt;
    }
    return Identity(Hash256(bytes));
}

bool ParseAmount(const std::string& str, uint64_t& out) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
        return false;
    }
    try {
        size_t pos = 0;
        out = std::stoull(str, &pos);
        return pos == str.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseVote(const std::string& str, bool& voteYes) {
    if (str == "yes" || str == "y") {
        voteYes = true;
        return true;
    }
    if (str == "no" || str == "n") {
        voteYes = false;
        return true;
    }
    return false;
}

/// Report a bad argument and return the usage exit code
int BadArg(const std::string& what, const std::string& value) {
    std::cerr << "Error: invalid " << what << ": '" << value << "'\n";
    return 2;
}

int Fail(const dao::Result& r) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return 1;
}

// ============================================================================
// Key Files
// ============================================================================

fs::path KeyPath(const Invocation& inv) {
    return inv.config.GetPath("key", (inv.dataDir / DEFAULT_KEY_FILE).string());
}

std::optional<PrivateKey> LoadKey(const Invocation& inv) {
    fs::path path = KeyPath(inv);
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open key file " << path
                  << " (run 'privdao-cli keygen' first)\n";
        return std::nullopt;
    }
    std::string hex;
    std::getline(in, hex);
    auto key = PrivateKey::FromHex(hex);
    if (!key) {
        std::cerr << "Error: key file " << path << " does not hold a 32-byte hex seed\n";
    }
    return key;
}

std::optional<Identity> LoadIdentity(const Invocation& inv) {
    auto key = LoadKey(inv);
    if (!key) return std::nullopt;
    auto id = key->GetIdentity();
    if (!id) {
        std::cerr << "Error: cannot derive identity from key\n";
    }
    return id;
}

bool EnsureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Error: cannot create directory " << dir << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Salt Files
// ============================================================================

fs::path SaltPath(const Invocation& inv, const Hash256& proposalKey, const Identity& voter) {
    return inv.dataDir / SALT_DIR / (proposalKey.ToHex() + "_" + voter.ToHex());
}

bool StoreSalt(const fs::path& path, bool voteYes, const Salt& salt) {
    if (!EnsureDir(path.parent_path())) return false;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write salt file " << path << "\n";
        return false;
    }
    out << (voteYes ? "yes" : "no") << " " << BytesToHex(salt) << "\n";
    out.close();
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, ec);
    if (ec) {
        LOG_WARN(util::LogCategory::CLI) << "cannot restrict " << path.string() << ": "
                                         << ec.message();
    }
    return static_cast<bool>(out);
}

bool LoadSalt(const fs::path& path, bool& voteYes, Salt& salt) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Error: no stored ballot at " << path << "\n";
        return false;
    }
    std::string vote, hex;
    in >> vote >> hex;
    if (!ParseVote(vote, voteYes) || !ParseFixedHex(hex, salt)) {
        std::cerr << "Error: malformed ballot file " << path << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Engine
// ============================================================================

/// The engine and its collaborators over the LevelDB state directory
struct EngineHandle {
    dao::LoggingEventListener listener;
    std::unique_ptr<db::Database> database;
    std::unique_ptr<dao::StateStore> store;
    std::unique_ptr<dao::LedgerBalanceSource> balances;
    std::unique_ptr<dao::LedgerTreasuryGateway> gateway;
    std::unique_ptr<dao::DaoEngine> engine;
};

bool OpenEngine(const Invocation& inv, EngineHandle& h) {
    dao::EngineOptions options;
    util::ConfigParseResult pr = dao::LoadEngineOptions(inv.config, options);
    if (!pr.success) {
        std::cerr << "Error: " << pr.ToString() << "\n";
        return false;
    }

    auto [status, database] = db::OpenDatabase(inv.dataDir / STATE_DIR);
    if (!status.ok()) {
        std::cerr << "Error: cannot open state database: " << status.ToString() << "\n";
        return false;
    }

    h.database = std::move(database);
    h.store = std::make_unique<dao::StateStore>(*h.database);
    h.balances = std::make_unique<dao::LedgerBalanceSource>(*h.store);
    h.gateway = std::make_unique<dao::LedgerTreasuryGateway>(*h.store);
    h.engine = std::make_unique<dao::DaoEngine>(*h.store, *h.balances, *h.gateway, options);
    h.engine->AddListener(&h.listener);
    return true;
}

dao::RequestContext Context(const Invocation& inv, const Identity& caller) {
    dao::RequestContext ctx;
    ctx.caller = caller;
    ctx.now = inv.now;
    ctx.slot = inv.slot;
    return ctx;
}

// ============================================================================
// Command: Keys
// ============================================================================

int CommandKeygen(const Invocation& inv) {
    fs::path path = inv.Arg(1).empty() ? KeyPath(inv) : fs::path(inv.Arg(1));
    if (fs::exists(path)) {
        std::cerr << "Error: key file already exists at " << path << "\n";
        return 1;
    }
    if (!path.parent_path().empty() && !EnsureDir(path.parent_path())) {
        return 1;
    }

    PrivateKey key = PrivateKey::Generate();
    auto id = key.GetIdentity();
    if (!id) {
        std::cerr << "Error: key generation failed\n";
        return 1;
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write key file " << path << "\n";
        return 1;
    }
    out << key.ToHex() << "\n";
    out.close();
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, ec);
    if (ec) {
        std::cerr << "Warning: cannot restrict permissions on " << path << ": "
                  << ec.message() << "\n";
    }

    std::cout << "Key file:  " << path.string() << "\n";
    std::cout << "Identity:  " << id->ToHex() << "\n";
    return 0;
}

int CommandIdentity(const Invocation& inv) {
    auto id = LoadIdentity(inv);
    if (!id) return 1;
    std::cout << id->ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: Ledger
// ============================================================================

/// mint <account|self> <native|token> <amount>
int CommandMint(const Invocation& inv, EngineHandle& h) {
    std::optional<Identity> account;
    if (inv.Arg(1) == "self") {
        account = LoadIdentity(inv);
        if (!account) return 1;
    } else {
        account = ParseIdentity(inv.Arg(1));
        if (!account) return BadArg("account", inv.Arg(1));
    }

    uint64_t amount = 0;
    if (!ParseAmount(inv.Arg(3), amount)) return BadArg("amount", inv.Arg(3));

    dao::Transaction tx(*h.store);
    dao::Result r;
    if (inv.Arg(2) == "native") {
        r = dao::ValueLedger::Credit(tx, *account, amount);
    } else {
        auto token = ParseIdentity(inv.Arg(2));
        if (!token) return BadArg("token", inv.Arg(2));
        r = dao::ValueLedger::CreditToken(tx, *account, *token, amount);
    }
    if (r.ok()) r = tx.Commit();
    if (!r.ok()) return Fail(r);

    LOG_INFO(util::LogCategory::CLI) << "minted " << amount << " " << inv.Arg(2)
                                     << " to " << account->ToHex();
    std::cout << "Credited " << amount << " to " << account->ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: DAO Configuration
// ============================================================================

bool ReadDaoParams(const Invocation& inv, dao::DaoConfigParams& params) {
    params.name = inv.config.GetString("name", "");

    auto quorum = inv.config.TryGetUInt("quorum");
    if (!quorum || *quorum > 255) {
        std::cerr << "Error: --quorum=<1..100> is required\n";
        return false;
    }
    params.quorumPercentage = static_cast<uint8_t>(*quorum);
    params.requiredBalance = inv.config.GetUInt("required-balance", 0);
    params.revealWindowSeconds = inv.config.GetInt("reveal-window", 0);
    params.executionDelaySeconds = inv.config.GetInt("delay", 0);

    std::string mode = inv.config.GetString("mode", "token-weighted");
    auto parsed = dao::VotingModeFromString(mode);
    if (!parsed) {
        std::cerr << "Error: unknown voting mode '" << mode << "'\n";
        return false;
    }
    params.votingConfig.mode = *parsed;
    params.votingConfig.capitalThreshold =
        static_cast<uint8_t>(std::min<uint64_t>(inv.config.GetUInt("capital-threshold", 0), 255));
    params.votingConfig.communityThreshold =
        static_cast<uint8_t>(std::min<uint64_t>(inv.config.GetUInt("community-threshold", 0), 255));
    return true;
}

/// create-dao <token>   or   migrate-dao <token> <origin>
int CommandCreateDao(const Invocation& inv, EngineHandle& h, bool migrate) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto token = ParseIdentity(inv.Arg(1));
    if (!token) return BadArg("governance token", inv.Arg(1));

    dao::DaoConfigParams params;
    if (!ReadDaoParams(inv, params)) return 2;

    Hash256 daoKey;
    dao::Result r;
    if (migrate) {
        auto origin = ParseIdentity(inv.Arg(2));
        if (!origin) return BadArg("migration origin", inv.Arg(2));
        r = h.engine->MigrateConfig(Context(inv, *caller), *token, *origin, params, daoKey);
    } else {
        r = h.engine->CreateConfig(Context(inv, *caller), *token, params, daoKey);
    }
    if (!r.ok()) return Fail(r);

    std::cout << daoKey.ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: Proposals
// ============================================================================

bool ReadTreasuryAction(const Invocation& inv, std::optional<dao::TreasuryAction>& out) {
    auto type = inv.config.TryGetString("action");
    if (!type) {
        out.reset();
        return true;
    }

    dao::TreasuryAction action;
    auto parsed = dao::TreasuryActionTypeFromString(*type);
    if (!parsed) {
        std::cerr << "Error: unknown treasury action '" << *type << "'\n";
        return false;
    }
    action.type = *parsed;
    action.amount = inv.config.GetUInt("amount", 0);

    auto recipient = ParseIdentity(inv.config.GetString("recipient", ""));
    if (!recipient) {
        std::cerr << "Error: --recipient=<identity> is required with --action\n";
        return false;
    }
    action.recipient = *recipient;

    if (auto mint = inv.config.TryGetString("mint")) {
        auto token = ParseIdentity(*mint);
        if (!token) {
            std::cerr << "Error: invalid --mint\n";
            return false;
        }
        action.tokenMint = *token;
    }
    out = action;
    return true;
}

/// create-proposal <dao>
int CommandCreateProposal(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto daoKey = ParseIdentity(inv.Arg(1));
    if (!daoKey) return BadArg("dao", inv.Arg(1));

    dao::ProposalParams params;
    params.title = inv.config.GetString("title", "");
    params.description = inv.config.GetString("description", "");
    params.votingDurationSeconds = inv.config.GetInt("duration", 0);
    if (!ReadTreasuryAction(inv, params.treasuryAction)) return 2;

    Hash256 proposalKey;
    dao::Result r = h.engine->CreateProposal(Context(inv, *caller), *daoKey, params, proposalKey);
    if (!r.ok()) return Fail(r);

    std::cout << proposalKey.ToHex() << "\n";
    return 0;
}

/// cancel <proposal>   or   veto <proposal>
int CommandAuthorityAction(const Invocation& inv, EngineHandle& h, bool veto) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    dao::RequestContext ctx = Context(inv, *caller);
    dao::Result r = veto ? h.engine->VetoProposal(ctx, *proposalKey)
                         : h.engine->CancelProposal(ctx, *proposalKey);
    if (!r.ok()) return Fail(r);

    std::cout << (veto ? "Vetoed " : "Cancelled ") << proposalKey->ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: Voting
// ============================================================================

std::optional<Identity> ReadKeeper(const Invocation& inv, bool& ok) {
    ok = true;
    auto hex = inv.config.TryGetString("keeper");
    if (!hex) return std::nullopt;
    auto keeper = ParseIdentity(*hex);
    if (!keeper) {
        std::cerr << "Error: invalid --keeper\n";
        ok = false;
    }
    return keeper;
}

/**
 * commit-vote <proposal> <yes|no>
 * commit-delegated <proposal> <delegation> <yes|no>
 *
 * A fresh salt is generated and stored with the vote under the data
 * directory; reveal-vote reads it back.
 */
int CommandCommit(const Invocation& inv, EngineHandle& h, bool delegated) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    std::optional<Identity> delegationKey;
    const std::string& voteArg = delegated ? inv.Arg(3) : inv.Arg(2);
    if (delegated) {
        delegationKey = ParseIdentity(inv.Arg(2));
        if (!delegationKey) return BadArg("delegation", inv.Arg(2));
    }
    bool voteYes = false;
    if (!ParseVote(voteArg, voteYes)) return BadArg("vote", voteArg);

    bool keeperOk = true;
    std::optional<Identity> keeper = ReadKeeper(inv, keeperOk);
    if (!keeperOk) return 2;

    fs::path saltPath = SaltPath(inv, *proposalKey, *caller);
    if (fs::exists(saltPath)) {
        std::cerr << "Error: a ballot is already stored at " << saltPath << "\n";
        return 1;
    }

    Salt salt = GetRandSalt();
    Commitment commitment = dao::ComputeCommitment(voteYes, salt, *caller);
    dao::RequestContext ctx = Context(inv, *caller);
    dao::Result r = delegated
        ? h.engine->CommitDelegatedVote(ctx, *proposalKey, *delegationKey, commitment, keeper)
        : h.engine->CommitVote(ctx, *proposalKey, commitment, keeper);
    if (!r.ok()) return Fail(r);

    if (!StoreSalt(saltPath, voteYes, salt)) {
        std::cerr << "Warning: the commitment is recorded but the salt was not saved;"
                  << " salt " << BytesToHex(salt) << "\n";
        return 1;
    }

    std::cout << "Commitment: " << commitment.ToHex() << "\n";
    std::cout << "Ballot:     " << saltPath.string() << "\n";
    return 0;
}

/// delegate <proposal> <delegatee>
int CommandDelegate(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));
    auto delegatee = ParseIdentity(inv.Arg(2));
    if (!delegatee) return BadArg("delegatee", inv.Arg(2));

    dao::Result r = h.engine->Delegate(Context(inv, *caller), *proposalKey, *delegatee);
    if (!r.ok()) return Fail(r);

    std::cout << dao::DelegationKey(*proposalKey, *caller).ToHex() << "\n";
    return 0;
}

/**
 * reveal-vote <proposal> [voter]
 *
 * Uses the ballot stored by commit-vote, or --vote and --salt when a
 * keeper reveals for another voter.
 */
int CommandReveal(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    Identity voter = *caller;
    if (!inv.Arg(2).empty()) {
        auto parsed = ParseIdentity(inv.Arg(2));
        if (!parsed) return BadArg("voter", inv.Arg(2));
        voter = *parsed;
    }

    bool voteYes = false;
    Salt salt;
    auto saltHex = inv.config.TryGetString("salt");
    if (saltHex) {
        std::string vote = inv.config.GetString("vote", "");
        if (!ParseVote(vote, voteYes)) return BadArg("vote", vote);
        if (!ParseFixedHex(*saltHex, salt)) return BadArg("salt", *saltHex);
    } else if (!LoadSalt(SaltPath(inv, *proposalKey, voter), voteYes, salt)) {
        return 1;
    }

    dao::Result r = h.engine->RevealVote(Context(inv, *caller), *proposalKey, voter,
                                         voteYes, salt);
    if (!r.ok()) return Fail(r);

    std::cout << "Revealed " << (voteYes ? "yes" : "no") << " for " << voter.ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: Finalize and Execute
// ============================================================================

int CommandFinalize(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    dao::TallyOutcome outcome;
    dao::Result r = h.engine->Finalize(Context(inv, *caller), *proposalKey, &outcome);
    if (!r.ok()) return Fail(r);

    std::cout << "Quorum: " << (outcome.quorumMet ? "met" : "not met") << "\n";
    std::cout << "Result: " << (outcome.passed ? "Passed" : "Failed") << "\n";
    return 0;
}

/// execute <proposal> [target]
int CommandExecute(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    std::optional<Identity> target;
    if (!inv.Arg(2).empty()) {
        target = ParseIdentity(inv.Arg(2));
        if (!target) return BadArg("target", inv.Arg(2));
    }

    dao::Result r = h.engine->Execute(Context(inv, *caller), *proposalKey, target);
    if (!r.ok()) return Fail(r);

    std::cout << "Executed " << proposalKey->ToHex() << "\n";
    return 0;
}

// ============================================================================
// Command: Treasury and Voter Weight
// ============================================================================

/// deposit-treasury <dao> <amount> [--token=<token>]
int CommandDeposit(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto daoKey = ParseIdentity(inv.Arg(1));
    if (!daoKey) return BadArg("dao", inv.Arg(1));
    uint64_t amount = 0;
    if (!ParseAmount(inv.Arg(2), amount)) return BadArg("amount", inv.Arg(2));

    dao::Result r;
    if (auto tokenHex = inv.config.TryGetString("token")) {
        auto token = ParseIdentity(*tokenHex);
        if (!token) return BadArg("token", *tokenHex);
        r = h.engine->DepositTreasuryToken(Context(inv, *caller), *daoKey, *token, amount);
    } else {
        r = h.engine->DepositTreasury(Context(inv, *caller), *daoKey, amount);
    }
    if (!r.ok()) return Fail(r);

    std::cout << "Treasury " << dao::TreasuryAccount(*daoKey).ToHex() << "\n";
    return 0;
}

/// sync-weight <dao> <realm> <governing-token>
int CommandSyncWeight(const Invocation& inv, EngineHandle& h) {
    auto caller = LoadIdentity(inv);
    if (!caller) return 1;
    auto daoKey = ParseIdentity(inv.Arg(1));
    if (!daoKey) return BadArg("dao", inv.Arg(1));
    auto realm = ParseIdentity(inv.Arg(2));
    if (!realm) return BadArg("realm", inv.Arg(2));
    auto token = ParseIdentity(inv.Arg(3));
    if (!token) return BadArg("governing token", inv.Arg(3));

    dao::VoterWeightRecord record;
    dao::Result r = h.engine->SyncExternalVotingWeight(Context(inv, *caller), *daoKey,
                                                       *realm, *token, &record);
    if (!r.ok()) return Fail(r);

    std::cout << record.ToString() << "\n";
    return 0;
}

// ============================================================================
// Command: Inspection
// ============================================================================

int CommandShowDao(const Invocation& inv, EngineHandle& h) {
    auto daoKey = ParseIdentity(inv.Arg(1));
    if (!daoKey) return BadArg("dao", inv.Arg(1));

    std::optional<dao::DaoConfig> config;
    dao::Result r = h.engine->GetDao(*daoKey, config);
    if (r.ok() && !config) r = dao::Result::Error(dao::DaoError::DAO_NOT_FOUND, "no such DAO");
    if (!r.ok()) return Fail(r);

    Amount treasury = 0;
    r = h.engine->GetTreasuryBalance(*daoKey, treasury);
    if (!r.ok()) return Fail(r);

    std::vector<std::pair<Hash256, dao::Proposal>> proposals;
    r = h.engine->ListProposals(*daoKey, proposals);
    if (!r.ok()) return Fail(r);

    std::cout << config->ToString() << "\n";
    std::cout << "treasury: " << dao::TreasuryAccount(*daoKey).ToHex()
              << " balance " << treasury << "\n";
    for (const auto& [key, proposal] : proposals) {
        std::cout << "  #" << proposal.id << " " << key.ToHex() << " "
                  << dao::ProposalStatusToString(proposal.status) << " \""
                  << proposal.title << "\"\n";
    }
    return 0;
}

int CommandShowProposal(const Invocation& inv, EngineHandle& h) {
    auto proposalKey = ParseIdentity(inv.Arg(1));
    if (!proposalKey) return BadArg("proposal", inv.Arg(1));

    std::optional<dao::Proposal> proposal;
    dao::Result r = h.engine->GetProposal(*proposalKey, proposal);
    if (r.ok() && !proposal) {
        r = dao::Result::Error(dao::DaoError::PROPOSAL_NOT_FOUND, "no such proposal");
    }
    if (!r.ok()) return Fail(r);

    std::cout << proposal->ToString() << "\n";

    if (inv.args.size() > 2) {
        auto voter = ParseIdentity(inv.Arg(2));
        if (!voter) return BadArg("voter", inv.Arg(2));
        uint64_t weight = 0;
        r = h.engine->ReadCommittedWeight(*proposalKey, *voter, weight);
        if (!r.ok()) return Fail(r);
        std::cout << "committed weight: " << weight << "\n";
    }
    return 0;
}

int CommandEvents(const Invocation& inv, EngineHandle& h) {
    std::vector<dao::Event> events;
    dao::Result r = h.engine->ReadEvents(inv.config.GetUInt("from", 0),
                                         inv.config.GetUInt("count", 100), events);
    if (!r.ok()) return Fail(r);

    for (const dao::Event& event : events) {
        std::cout << event.ToString() << "\n";
    }
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "PrivDAO Command-Line Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: privdao-cli [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  keygen [path]                          Generate a member key\n";
    std::cout << "  identity                               Print the member identity\n";
    std::cout << "  mint <account|self> <native|token> <n> Credit the local ledger\n";
    std::cout << "  create-dao <token>                     Create a DAO (see DAO options)\n";
    std::cout << "  migrate-dao <token> <origin>           Create a DAO migrated from origin\n";
    std::cout << "  create-proposal <dao>                  Create a proposal\n";
    std::cout << "  cancel <proposal>                      Cancel while voting (authority)\n";
    std::cout << "  veto <proposal>                        Veto during timelock (authority)\n";
    std::cout << "  commit-vote <proposal> <yes|no>        Commit a sealed ballot\n";
    std::cout << "  delegate <proposal> <delegatee>        Delegate voting weight\n";
    std::cout << "  commit-delegated <proposal> <delegation> <yes|no>\n";
    std::cout << "                                         Commit with delegated weight\n";
    std::cout << "  reveal-vote <proposal> [voter]         Reveal a stored ballot\n";
    std::cout << "  finalize <proposal>                    Tally after the reveal window\n";
    std::cout << "  execute <proposal> [target]            Execute after the timelock\n";
    std::cout << "  deposit-treasury <dao> <amount>        Fund the DAO treasury\n";
    std::cout << "  sync-weight <dao> <realm> <token>      Publish external voting weight\n";
    std::cout << "  show-dao <dao>                         Show a DAO and its proposals\n";
    std::cout << "  show-proposal <proposal> [voter]       Show a proposal and a committed weight\n";
    std::cout << "  events                                 Print the event log\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --datadir=<dir>        Data directory (default: ~/.privdao)\n";
    std::cout << "  --conf=<file>          Config file (default: <datadir>/privdao.conf)\n";
    std::cout << "  --key=<file>           Member key file (default: <datadir>/member.key)\n";
    std::cout << "  --now=<seconds>        Request time (default: wall clock)\n";
    std::cout << "  --slot=<n>             Host slot for sync-weight\n";
    std::cout << "  --debug                Debug logging\n";
    std::cout << "  --printtoconsole       Log to stderr\n";
    std::cout << "\n";
    std::cout << "DAO options:\n";
    std::cout << "  --name --quorum --required-balance --reveal-window --delay\n";
    std::cout << "  --mode=<token-weighted|quadratic|dual-chamber>\n";
    std::cout << "  --capital-threshold --community-threshold\n";
    std::cout << "\n";
    std::cout << "Proposal options:\n";
    std::cout << "  --title --description --duration\n";
    std::cout << "  --action=<send-sol|send-token|custom-cpi> --amount --recipient --mint\n";
    std::cout << "\n";
    std::cout << "Other options:\n";
    std::cout << "  --keeper=<identity>    Allow a keeper to reveal (commit commands)\n";
    std::cout << "  --vote --salt          Explicit ballot for reveal-vote\n";
    std::cout << "  --token=<token>        Token deposit for deposit-treasury\n";
    std::cout << "  --from --count         Event log range\n";
    std::cout << "\n";
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const Invocation& inv) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = inv.config.GetBool("debug", false)
        ? util::LogLevel::Debug
        : util::LogLevelFromString(inv.config.GetString("loglevel", "info"));
    logger.SetLevel(level);

    if (inv.config.GetBool("printtoconsole", false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    auto fileSink = std::make_shared<util::FileSink>((inv.dataDir / LOG_FILE).string(), level);
    if (fileSink->IsOpen()) {
        logger.AddSink(fileSink);
    }
}

/// Command line, then the config file, then the command line again so it wins
bool LoadConfig(int argc, char* argv[], Invocation& inv) {
    util::ConfigManager cmdline;
    util::ConfigParseResult r = cmdline.ParseCommandLine(argc, argv, inv.args);
    if (!r.success) {
        std::cerr << "Error: " << r.ToString() << "\n";
        return false;
    }

    inv.dataDir = cmdline.GetPath("datadir", util::ConfigManager::GetDefaultDataDir());
    std::string confPath =
        cmdline.GetPath("conf", (inv.dataDir / util::DEFAULT_CONFIG_FILENAME).string());

    if (fs::exists(confPath)) {
        r = inv.config.ParseFile(confPath);
        if (!r.success) {
            std::cerr << "Error: " << r.ToString() << "\n";
            return false;
        }
    } else if (cmdline.HasKey("conf")) {
        std::cerr << "Error: config file not found: " << confPath << "\n";
        return false;
    }

    std::vector<std::string> ignored;
    r = inv.config.ParseCommandLine(argc, argv, ignored);
    if (!r.success) {
        std::cerr << "Error: " << r.ToString() << "\n";
        return false;
    }
    inv.dataDir = inv.config.GetPath("datadir", inv.dataDir.string());

    auto now = inv.config.TryGetInt("now");
    if (inv.config.HasKey("now") && !now) {
        std::cerr << "Error: --now must be an integer\n";
        return false;
    }
    inv.now = now.value_or(GetTime());
    inv.slot = inv.config.GetUInt("slot", 0);
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    Invocation inv;
    if (!LoadConfig(argc, argv, inv)) {
        return 2;
    }

    const std::string& command = inv.Arg(0);
    if (command.empty() || command == "help" || inv.config.GetBool("help", false)) {
        PrintUsage();
        return command.empty() && !inv.config.GetBool("help", false) ? 1 : 0;
    }
    if (command == "version") {
        std::cout << "PrivDAO Command-Line Tool v" << VERSION << "\n";
        return 0;
    }

    if (!EnsureDir(inv.dataDir)) {
        return 1;
    }
    SetupLogging(inv);

    if (command == "keygen") return CommandKeygen(inv);
    if (command == "identity") return CommandIdentity(inv);

    EngineHandle h;
    if (!OpenEngine(inv, h)) {
        return 1;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "command " << command << " at " << inv.now;

    if (command == "mint") return CommandMint(inv, h);
    if (command == "create-dao") return CommandCreateDao(inv, h, false);
    if (command == "migrate-dao") return CommandCreateDao(inv, h, true);
    if (command == "create-proposal") return CommandCreateProposal(inv, h);
    if (command == "cancel") return CommandAuthorityAction(inv, h, false);
    if (command == "veto") return CommandAuthorityAction(inv, h, true);
    if (command == "commit-vote") return CommandCommit(inv, h, false);
    if (command == "commit-delegated") return CommandCommit(inv, h, true);
    if (command == "delegate") return CommandDelegate(inv, h);
    if (command == "reveal-vote") return CommandReveal(inv, h);
    if (command == "finalize") return CommandFinalize(inv, h);
    if (command == "execute") return CommandExecute(inv, h);
    if (command == "deposit-treasury") return CommandDeposit(inv, h);
    if (command == "sync-weight") return CommandSyncWeight(inv, h);
    if (command == "show-dao") return CommandShowDao(inv, h);
    if (command == "show-proposal") return CommandShowProposal(inv, h);
    if (command == "events") return CommandEvents(inv, h);

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'privdao-cli help' for usage.\n";
    return 1;
}

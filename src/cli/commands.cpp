// PROPSHARE - Console Commands Implementation
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <propshare/cli/commands.h>
#include <propshare/service/service.h>
#include <propshare/util/logging.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace propshare {
namespace cli {

// ============================================================================
// Parsing Helpers
// ============================================================================

std::optional<std::vector<std::string>> TokenizeCommandLine(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (inQuotes) {
            if (c == '\\' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                current += c;
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
            hasToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current += c;
            hasToken = true;
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }
    if (hasToken) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty() || str.size() > 20) {
        return std::nullopt;
    }
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return static_cast<Amount>(std::stoull(str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> ParseYesNo(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "yes" || lower == "true" || lower == "1" || lower == "y") return true;
    if (lower == "no" || lower == "false" || lower == "0" || lower == "n") return false;
    return std::nullopt;
}

// ============================================================================
// CommandResult / Command
// ============================================================================

std::string CommandResult::ToString() const {
    if (success) {
        return output;
    }
    if (error) {
        return std::string("error: ") + LedgerErrorToString(*error);
    }
    return "usage: " + usageError;
}

size_t Command::MinArgs() const {
    return static_cast<size_t>(std::count_if(argNames.begin(), argNames.end(),
                                             [](const std::string& arg) {
        return arg.empty() || arg[0] != '[';
    }));
}

std::string Command::Usage() const {
    std::string usage = name;
    for (const auto& arg : argNames) {
        usage += ' ';
        usage += (!arg.empty() && arg[0] == '[') ? arg : "<" + arg + ">";
    }
    return usage;
}

namespace {

CommandResult FromError(LedgerError err, const std::string& okText) {
    return err == LedgerError::OK ? CommandResult::Ok(okText) : CommandResult::Failure(err);
}

CommandResult InvalidArgument(const char* what, const std::string& value) {
    return CommandResult::Usage(std::string("invalid ") + what + ": " + value);
}

std::string FormatProperty(const registry::Property& property) {
    std::ostringstream oss;
    oss << property.ToString();
    if (!property.metadata.description.empty()) {
        oss << "\n  " << property.metadata.description;
    }
    return oss.str();
}

} // namespace

// ============================================================================
// CommandTable
// ============================================================================

CommandTable::CommandTable(service::LedgerService& service)
    : service_(service) {
    RegisterSessionCommands();
    RegisterAccessCommands();
    RegisterRegistryCommands();
    RegisterOwnershipCommands();
    RegisterIncomeCommands();
    RegisterMarketCommands();
    RegisterGovernanceCommands();
    RegisterAuditCommands();
}

const Command* CommandTable::Find(const std::string& name) const {
    for (const auto& command : commands_) {
        if (command.name == name) {
            return &command;
        }
    }
    return nullptr;
}

std::vector<Command> CommandTable::GetCommandsByCategory(const std::string& category) const {
    std::vector<Command> result;
    for (const auto& command : commands_) {
        if (command.category == category) {
            result.push_back(command);
        }
    }
    return result;
}

std::string CommandTable::Help() const {
    std::vector<std::string> order;
    std::map<std::string, std::vector<const Command*>> byCategory;
    for (const auto& command : commands_) {
        if (byCategory.find(command.category) == byCategory.end()) {
            order.push_back(command.category);
        }
        byCategory[command.category].push_back(&command);
    }

    std::ostringstream oss;
    for (const auto& category : order) {
        oss << "== " << category << " ==\n";
        for (const Command* command : byCategory[category]) {
            oss << "  " << command->Usage() << "\n"
                << "      " << command->description << "\n";
        }
    }
    return oss.str();
}

CommandResult CommandTable::Execute(const std::string& line) {
    auto tokens = TokenizeCommandLine(line);
    if (!tokens) {
        return CommandResult::Usage("unterminated quote");
    }
    if (tokens->empty() || (*tokens)[0][0] == '#') {
        return CommandResult::Ok();
    }
    return Dispatch(*tokens);
}

CommandResult CommandTable::Dispatch(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return CommandResult::Ok();
    }

    const Command* command = Find(tokens[0]);
    if (!command) {
        return CommandResult::Usage("unknown command '" + tokens[0] + "' (try 'help')");
    }

    std::vector<std::string> args(tokens.begin() + 1, tokens.end());
    if (args.size() < command->MinArgs() || args.size() > command->MaxArgs()) {
        return CommandResult::Usage(command->Usage());
    }

    LOG_TRACE(util::LogCategory::CLI) << "dispatch " << command->name << " as '" << caller_ << "'";
    return command->handler(args);
}

// ============================================================================
// Session
// ============================================================================

void CommandTable::RegisterSessionCommands() {
    commands_.push_back({
        "help",
        Category::SESSION,
        "List commands, or show usage of one command.",
        [this](const std::vector<std::string>& args) {
            if (args.empty()) {
                return CommandResult::Ok(Help());
            }
            const Command* command = Find(args[0]);
            if (!command) {
                return CommandResult::Usage("unknown command '" + args[0] + "'");
            }
            return CommandResult::Ok(command->Usage() + "\n  " + command->description);
        },
        {"[command]"}
    });

    commands_.push_back({
        "caller",
        Category::SESSION,
        "Act as the given identity for caller-scoped commands.",
        [this](const std::vector<std::string>& args) {
            caller_ = args[0];
            return CommandResult::Ok("caller is " + caller_);
        },
        {"identity"}
    });

    commands_.push_back({
        "whoami",
        Category::SESSION,
        "Show the current caller, its role and KYC status.",
        [this](const std::vector<std::string>&) {
            std::ostringstream oss;
            oss << (caller_.empty() ? "(anonymous)" : caller_)
                << " role=" << auth::RoleToString(service_.GetMyRole(caller_))
                << " kyc=" << (service_.IsMyKycVerified(caller_) ? "verified" : "unverified");
            return CommandResult::Ok(oss.str());
        },
        {}
    });
}

// ============================================================================
// Access
// ============================================================================

void CommandTable::RegisterAccessCommands() {
    commands_.push_back({
        "bootstrap_admin",
        Category::ACCESS,
        "Grant Admin to an identity. Only the first call succeeds.",
        [this](const std::vector<std::string>& args) {
            return FromError(service_.BootstrapAdmin(args[0]), args[0] + " is admin");
        },
        {"identity"}
    });

    commands_.push_back({
        "set_role",
        Category::ACCESS,
        "Assign Admin, Manager or User (caller must be Admin).",
        [this](const std::vector<std::string>& args) {
            auto role = auth::ParseRole(args[1]);
            if (!role) {
                return CommandResult::Usage("invalid role: " + args[1]);
            }
            return FromError(service_.SetRole(caller_, args[0], *role),
                             args[0] + " is " + auth::RoleToString(*role));
        },
        {"identity", "role"}
    });

    commands_.push_back({
        "set_kyc",
        Category::ACCESS,
        "Set KYC verification of an identity (caller must be Admin).",
        [this](const std::vector<std::string>& args) {
            auto verified = ParseYesNo(args[1]);
            if (!verified) {
                return CommandResult::Usage("invalid flag: " + args[1]);
            }
            return FromError(service_.SetKycStatus(caller_, args[0], *verified),
                             args[0] + (*verified ? " verified" : " unverified"));
        },
        {"identity", "verified"}
    });
}

// ============================================================================
// Registry
// ============================================================================

void CommandTable::RegisterRegistryCommands() {
    commands_.push_back({
        "register",
        Category::REGISTRY,
        "Register a property; all shares start unissued.",
        [this](const std::vector<std::string>& args) {
            auto totalShares = ParseAmount(args[1]);
            if (!totalShares) {
                return InvalidArgument("total shares", args[1]);
            }
            registry::PropertyMetadata metadata;
            if (args.size() > 2) metadata.location = args[2];
            if (args.size() > 3) metadata.description = args[3];

            auto result = service_.RegisterProperty(caller_, args[0], *totalShares, metadata);
            if (!result.IsOk()) {
                return CommandResult::Failure(result.error);
            }
            return CommandResult::Ok(result.value->ToString());
        },
        {"name", "total_shares", "[location]", "[description]"}
    });

    commands_.push_back({
        "update_metadata",
        Category::REGISTRY,
        "Replace location and description (caller must be Admin).",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            registry::PropertyMetadata metadata{args[1], args[2]};
            return FromError(service_.UpdatePropertyMetadata(caller_, *id, metadata),
                             "metadata updated");
        },
        {"property_id", "location", "description"}
    });

    commands_.push_back({
        "update_status",
        Category::REGISTRY,
        "Set Active, Maintenance or Sold (caller must be Admin).",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto status = registry::ParsePropertyStatus(args[1]);
            if (!status) {
                return CommandResult::Usage("invalid status: " + args[1]);
            }
            return FromError(service_.UpdatePropertyStatus(caller_, *id, *status),
                             std::string("status ") + registry::PropertyStatusToString(*status));
        },
        {"property_id", "status"}
    });

    commands_.push_back({
        "property",
        Category::REGISTRY,
        "Show a property.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto property = service_.GetProperty(*id);
            if (!property) {
                return CommandResult::Failure(LedgerError::NotFound);
            }
            return CommandResult::Ok(FormatProperty(*property));
        },
        {"property_id"}
    });
}

// ============================================================================
// Ownership
// ============================================================================

void CommandTable::RegisterOwnershipCommands() {
    commands_.push_back({
        "issue",
        Category::OWNERSHIP,
        "Issue shares from a property's available supply.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto amount = ParseAmount(args[2]);
            if (!amount) {
                return InvalidArgument("amount", args[2]);
            }
            return FromError(service_.IssueShares(*id, args[1], *amount),
                             "issued " + std::to_string(*amount) + " to " + args[1]);
        },
        {"property_id", "to", "amount"}
    });

    commands_.push_back({
        "transfer",
        Category::OWNERSHIP,
        "Move shares between holders.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto amount = ParseAmount(args[3]);
            if (!amount) {
                return InvalidArgument("amount", args[3]);
            }
            return FromError(service_.TransferShares(*id, args[1], args[2], *amount),
                             "transferred " + std::to_string(*amount));
        },
        {"property_id", "from", "to", "amount"}
    });

    commands_.push_back({
        "balance",
        Category::OWNERSHIP,
        "Show a holder's share balance.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            return CommandResult::Ok(std::to_string(service_.GetOwnership(*id, args[1])));
        },
        {"property_id", "holder"}
    });

    commands_.push_back({
        "holdings",
        Category::OWNERSHIP,
        "Show every property a holder owns shares in.",
        [this](const std::vector<std::string>& args) {
            std::ostringstream oss;
            for (const auto& record : service_.GetOwnershipStatement(args[0])) {
                oss << record.propertyId << " \"" << record.propertyName << "\" "
                    << record.shares << "\n";
            }
            std::string out = oss.str();
            if (!out.empty()) out.pop_back();
            return CommandResult::Ok(out);
        },
        {"holder"}
    });
}

// ============================================================================
// Income
// ============================================================================

void CommandTable::RegisterIncomeCommands() {
    commands_.push_back({
        "deposit",
        Category::INCOME,
        "Deposit rental income and split it across current holders.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto amount = ParseAmount(args[1]);
            if (!amount) {
                return InvalidArgument("amount", args[1]);
            }
            return FromError(service_.DepositRentalIncome(*id, *amount),
                             "deposited " + std::to_string(*amount));
        },
        {"property_id", "amount"}
    });

    commands_.push_back({
        "claim",
        Category::INCOME,
        "Pay out and clear a holder's unclaimed income.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            return CommandResult::Ok(std::to_string(service_.ClaimIncome(*id, args[1])));
        },
        {"property_id", "holder"}
    });

    commands_.push_back({
        "unclaimed",
        Category::INCOME,
        "Show a holder's unclaimed income.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            return CommandResult::Ok(std::to_string(service_.GetUnclaimedIncome(*id, args[1])));
        },
        {"property_id", "holder"}
    });

    commands_.push_back({
        "income",
        Category::INCOME,
        "Show every unclaimed income entry of a holder.",
        [this](const std::vector<std::string>& args) {
            std::ostringstream oss;
            for (const auto& record : service_.GetRentalIncomeStatement(args[0])) {
                oss << record.propertyId << " \"" << record.propertyName << "\" "
                    << record.income << "\n";
            }
            std::string out = oss.str();
            if (!out.empty()) out.pop_back();
            return CommandResult::Ok(out);
        },
        {"holder"}
    });
}

// ============================================================================
// Market
// ============================================================================

void CommandTable::RegisterMarketCommands() {
    commands_.push_back({
        "list",
        Category::MARKET,
        "Offer shares for sale at a price per share.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto amount = ParseAmount(args[2]);
            if (!amount) {
                return InvalidArgument("amount", args[2]);
            }
            auto price = ParseAmount(args[3]);
            if (!price) {
                return InvalidArgument("price", args[3]);
            }
            return FromError(service_.ListSharesForSale(*id, args[1], *amount, *price), "listed");
        },
        {"property_id", "seller", "amount", "price_per_share"}
    });

    commands_.push_back({
        "buy",
        Category::MARKET,
        "Buy from the first matching listing of a seller.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            auto amount = ParseAmount(args[3]);
            if (!amount) {
                return InvalidArgument("amount", args[3]);
            }
            auto result = service_.BuyShares(*id, args[1], args[2], *amount);
            if (!result.IsOk()) {
                return CommandResult::Failure(result.error);
            }
            return CommandResult::Ok("bought " + std::to_string(*amount) + " @ " +
                                     std::to_string(result.pricePerShare) + " = " +
                                     std::to_string(result.totalPrice));
        },
        {"property_id", "seller", "buyer", "amount"}
    });

    commands_.push_back({
        "listings",
        Category::MARKET,
        "Show open listings in insertion order.",
        [this](const std::vector<std::string>&) {
            std::ostringstream oss;
            for (const auto& listing : service_.GetMarketplaceListings()) {
                oss << listing.ToString() << "\n";
            }
            std::string out = oss.str();
            if (!out.empty()) out.pop_back();
            return CommandResult::Ok(out);
        },
        {}
    });
}

// ============================================================================
// Governance
// ============================================================================

void CommandTable::RegisterGovernanceCommands() {
    commands_.push_back({
        "propose",
        Category::GOVERNANCE,
        "Submit a proposal as the current caller.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            governance::ProposalType type = governance::ProposalType::Signal;
            if (args.size() > 2) {
                auto parsed = governance::ParseProposalType(args[2]);
                if (!parsed) {
                    return CommandResult::Usage("invalid proposal type: " + args[2]);
                }
                type = *parsed;
            }
            auto proposal = service_.SubmitProposal(caller_, *id, args[1], type);
            return CommandResult::Ok(proposal.ToString());
        },
        {"property_id", "description", "[type]"}
    });

    commands_.push_back({
        "vote",
        Category::GOVERNANCE,
        "Vote yes or no as the current caller.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("proposal id", args[0]);
            }
            auto approve = ParseYesNo(args[1]);
            if (!approve) {
                return CommandResult::Usage("invalid vote: " + args[1]);
            }
            return FromError(service_.VoteOnProposal(caller_, *id, *approve), "vote recorded");
        },
        {"proposal_id", "yes|no"}
    });

    commands_.push_back({
        "execute",
        Category::GOVERNANCE,
        "Close an open proposal.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("proposal id", args[0]);
            }
            LedgerError err = service_.ExecuteProposal(*id);
            if (err != LedgerError::OK) {
                return CommandResult::Failure(err);
            }
            auto proposal = service_.GetGovernance().GetProposal(*id);
            return CommandResult::Ok(proposal ? proposal->ToString() : "executed");
        },
        {"proposal_id"}
    });

    commands_.push_back({
        "proposals",
        Category::GOVERNANCE,
        "Show the proposals of a property.",
        [this](const std::vector<std::string>& args) {
            auto id = ParseAmount(args[0]);
            if (!id) {
                return InvalidArgument("property id", args[0]);
            }
            std::ostringstream oss;
            for (const auto& proposal : service_.GetProposals(*id)) {
                oss << proposal.ToString() << "\n";
            }
            std::string out = oss.str();
            if (!out.empty()) out.pop_back();
            return CommandResult::Ok(out);
        },
        {"property_id"}
    });
}

// ============================================================================
// Audit
// ============================================================================

void CommandTable::RegisterAuditCommands() {
    commands_.push_back({
        "audit",
        Category::AUDIT,
        "Check share conservation and report stale listings.",
        [this](const std::vector<std::string>&) {
            auto report = service_.Audit();
            std::ostringstream oss;
            oss << report.ToString();
            for (const auto& violation : report.violations) {
                oss << "\n  violation: " << violation.ToString();
            }
            for (const auto& stale : report.staleListings) {
                oss << "\n  stale: " << stale.listing.ToString();
            }
            return CommandResult::Ok(oss.str());
        },
        {}
    });
}


} // namespace cli
} // namespace propshare

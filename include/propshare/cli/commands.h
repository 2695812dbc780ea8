// PROPSHARE - Console Commands
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Text command table that drives a LedgerService. One command per line:
//
//   caller alice
//   register "Harbour Loft" 1000 Lisbon
//   issue 1 alice 600
//
// Arguments are separated by whitespace; double quotes group words.

#ifndef PROPSHARE_CLI_COMMANDS_H
#define PROPSHARE_CLI_COMMANDS_H

#include <propshare/core/types.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace propshare {

namespace service {
class LedgerService;
}

namespace cli {

// ============================================================================
// Command Categories
// ============================================================================

namespace Category {
    constexpr const char* SESSION = "Session";
    constexpr const char* ACCESS = "Access";
    constexpr const char* REGISTRY = "Registry";
    constexpr const char* OWNERSHIP = "Ownership";
    constexpr const char* INCOME = "Income";
    constexpr const char* MARKET = "Market";
    constexpr const char* GOVERNANCE = "Governance";
    constexpr const char* AUDIT = "Audit";
}

// ============================================================================
// Command Result
// ============================================================================

struct CommandResult {
    bool success{true};

    /// Text printed on success
    std::string output;

    /// Set when the ledger rejected the operation
    std::optional<LedgerError> error;

    /// Set when the input itself was malformed
    std::string usageError;

    static CommandResult Ok(const std::string& out = "") {
        CommandResult result;
        result.output = out;
        return result;
    }

    static CommandResult Failure(LedgerError err) {
        CommandResult result;
        result.success = false;
        result.error = err;
        return result;
    }

    static CommandResult Usage(const std::string& msg) {
        CommandResult result;
        result.success = false;
        result.usageError = msg;
        return result;
    }

    /// Output on success, "error: <Name>" or "usage: ..." otherwise
    std::string ToString() const;
};

// ============================================================================
// Command Definition
// ============================================================================

using CommandHandler = std::function<CommandResult(const std::vector<std::string>& args)>;

/// Registered console command. Optional arguments are written "[name]".
struct Command {
    std::string name;
    std::string category;
    std::string description;
    CommandHandler handler;
    std::vector<std::string> argNames;

    size_t MinArgs() const;
    size_t MaxArgs() const { return argNames.size(); }

    /// "name <arg> [opt]"
    std::string Usage() const;
};

// ============================================================================
// Command Table
// ============================================================================

class CommandTable {
public:
    explicit CommandTable(service::LedgerService& service);

    // Handlers capture this
    CommandTable(const CommandTable&) = delete;
    CommandTable& operator=(const CommandTable&) = delete;

    /**
     * Tokenize and run one line. Blank lines and lines starting with '#'
     * succeed with no output.
     */
    CommandResult Execute(const std::string& line);

    /// Run an already tokenized command
    CommandResult Dispatch(const std::vector<std::string>& tokens);

    const Command* Find(const std::string& name) const;
    const std::vector<Command>& GetCommands() const { return commands_; }
    std::vector<Command> GetCommandsByCategory(const std::string& category) const;

    /// Identity used for caller-scoped commands
    const HolderId& GetCaller() const { return caller_; }
    void SetCaller(const HolderId& caller) { caller_ = caller; }

    /// Command list grouped by category
    std::string Help() const;

private:
    void RegisterSessionCommands();
    void RegisterAccessCommands();
    void RegisterRegistryCommands();
    void RegisterOwnershipCommands();
    void RegisterIncomeCommands();
    void RegisterMarketCommands();
    void RegisterGovernanceCommands();
    void RegisterAuditCommands();

    service::LedgerService& service_;
    std::vector<Command> commands_;
    HolderId caller_;
};

// ============================================================================
// Parsing Helpers
// ============================================================================

/// Split a line on whitespace, honouring double quotes and \" escapes.
/// Returns nullopt for an unterminated quote.
std::optional<std::vector<std::string>> TokenizeCommandLine(const std::string& line);

/// Parse an unsigned decimal amount (digits only)
std::optional<Amount> ParseAmount(const std::string& str);

/// Parse yes/no, true/false, 1/0
std::optional<bool> ParseYesNo(const std::string& str);

} // namespace cli
} // namespace propshare

#endif // PROPSHARE_CLI_COMMANDS_H

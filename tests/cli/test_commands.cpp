// PROPSHARE - Console Command Tests
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <gtest/gtest.h>
#include <propshare/cli/commands.h>
#include <propshare/service/service.h>

#include <memory>

using namespace propshare;
using namespace propshare::cli;

// ============================================================================
// Tokenizer and parsers
// ============================================================================

TEST(TokenizeTest, SplitsOnWhitespace) {
    auto tokens = TokenizeCommandLine("  issue 1\talice   60 ");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 4u);
    EXPECT_EQ((*tokens)[0], "issue");
    EXPECT_EQ((*tokens)[3], "60");
}

TEST(TokenizeTest, QuotedStrings) {
    auto tokens = TokenizeCommandLine("register \"Harbour Loft\" 100 \"say \\\"hi\\\"\" \"\"");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 5u);
    EXPECT_EQ((*tokens)[1], "Harbour Loft");
    EXPECT_EQ((*tokens)[3], "say \"hi\"");
    EXPECT_EQ((*tokens)[4], "");
}

TEST(TokenizeTest, UnterminatedQuote) {
    EXPECT_FALSE(TokenizeCommandLine("register \"oops 100").has_value());
}

TEST(ParseTest, Amounts) {
    EXPECT_EQ(ParseAmount("0"), Amount(0));
    EXPECT_EQ(ParseAmount("18446744073709551615"), Amount(18446744073709551615ULL));
    EXPECT_FALSE(ParseAmount("18446744073709551616").has_value());
    EXPECT_FALSE(ParseAmount("-1").has_value());
    EXPECT_FALSE(ParseAmount("12abc").has_value());
    EXPECT_FALSE(ParseAmount("").has_value());
}

TEST(ParseTest, YesNo) {
    EXPECT_EQ(ParseYesNo("YES"), true);
    EXPECT_EQ(ParseYesNo("false"), false);
    EXPECT_FALSE(ParseYesNo("maybe").has_value());
}

// ============================================================================
// Command Table
// ============================================================================

class CommandTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_unique<service::LedgerService>();
        table_ = std::make_unique<CommandTable>(*service_);
    }

    CommandResult Run(const std::string& line) {
        return table_->Execute(line);
    }

    std::unique_ptr<service::LedgerService> service_;
    std::unique_ptr<CommandTable> table_;
};

TEST_F(CommandTableTest, BlankAndCommentLines) {
    EXPECT_TRUE(Run("").success);
    EXPECT_TRUE(Run("   ").success);
    EXPECT_TRUE(Run("# a comment").success);
    EXPECT_EQ(Run("# a comment").ToString(), "");
}

TEST_F(CommandTableTest, UnknownCommandIsUsageError) {
    CommandResult result = Run("frobnicate 1");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.ToString().rfind("usage:", 0), 0u);
}

TEST_F(CommandTableTest, ArgumentCountChecked) {
    CommandResult result = Run("issue 1 alice");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.ToString(), "usage: issue <property_id> <to> <amount>");

    EXPECT_FALSE(Run("listings extra").success);
}

TEST_F(CommandTableTest, InvalidNumberIsUsageError) {
    CommandResult result = Run("issue one alice 5");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.usageError.find("property id"), std::string::npos);
}

TEST_F(CommandTableTest, LaterInvalidArgumentLeavesStateUntouched) {
    ASSERT_TRUE(Run("register Loft 100").success);

    CommandResult result = Run("issue 1 alice lots");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.ToString(), "usage: invalid amount: lots");
    EXPECT_EQ(service_->GetOwnership(1, "alice"), 0u);

    result = Run("list 1 alice 5 cheap");
    EXPECT_EQ(result.ToString(), "usage: invalid price: cheap");
    EXPECT_TRUE(service_->GetMarketplaceListings().empty());
}

TEST_F(CommandTableTest, PriceOverflowReportedByName) {
    ASSERT_TRUE(Run("register Loft 100").success);
    ASSERT_TRUE(Run("issue 1 alice 10").success);
    EXPECT_EQ(Run("list 1 alice 2 18446744073709551615").ToString(), "error: PriceOverflow");
}

TEST_F(CommandTableTest, LedgerErrorsAreReportedByName) {
    CommandResult result = Run("issue 7 alice 5");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, LedgerError::NotFound);
    EXPECT_EQ(result.ToString(), "error: NotFound");
}

TEST_F(CommandTableTest, ScriptedLifecycle) {
    ASSERT_TRUE(Run("bootstrap_admin root").success);
    ASSERT_TRUE(Run("register \"Harbour Loft\" 100 Lisbon \"two rooms\"").success);
    ASSERT_TRUE(Run("issue 1 alice 60").success);
    ASSERT_TRUE(Run("issue 1 bob 40").success);
    ASSERT_TRUE(Run("deposit 1 101").success);

    EXPECT_EQ(Run("unclaimed 1 alice").output, "60");
    EXPECT_EQ(Run("balance 1 bob").output, "40");

    ASSERT_TRUE(Run("list 1 alice 20 5").success);
    CommandResult buy = Run("buy 1 alice carol 10");
    ASSERT_TRUE(buy.success);
    EXPECT_EQ(buy.output, "bought 10 @ 5 = 50");

    ASSERT_TRUE(Run("caller alice").success);
    ASSERT_TRUE(Run("propose 1 \"Replace roof\" operational").success);
    ASSERT_TRUE(Run("vote 1 yes").success);
    ASSERT_TRUE(Run("caller bob").success);
    ASSERT_TRUE(Run("vote 1 no").success);
    EXPECT_EQ(Run("vote 1 no").ToString(), "error: NotVotable");

    CommandResult executed = Run("execute 1");
    ASSERT_TRUE(executed.success);
    EXPECT_NE(executed.output.find("Executed"), std::string::npos);

    EXPECT_EQ(Run("claim 1 alice").output, "60");
    EXPECT_EQ(Run("claim 1 alice").output, "0");

    CommandResult audit = Run("audit");
    ASSERT_TRUE(audit.success);
    EXPECT_NE(audit.output.find("consistent"), std::string::npos);
    EXPECT_EQ(audit.output.find("INCONSISTENT"), std::string::npos);
}

TEST_F(CommandTableTest, CallerScopedAdministration) {
    ASSERT_TRUE(Run("bootstrap_admin root").success);

    EXPECT_EQ(Run("set_role bob manager").ToString(), "error: Unauthorized");
    ASSERT_TRUE(Run("caller root").success);
    EXPECT_TRUE(Run("set_role bob manager").success);
    EXPECT_TRUE(Run("set_kyc bob yes").success);

    ASSERT_TRUE(Run("caller bob").success);
    EXPECT_EQ(Run("whoami").output, "bob role=Manager kyc=verified");
    EXPECT_FALSE(Run("set_role bob admin").success);
}

TEST_F(CommandTableTest, HelpListsCategories) {
    CommandResult help = Run("help");
    ASSERT_TRUE(help.success);
    EXPECT_NE(help.output.find("== Market =="), std::string::npos);
    EXPECT_NE(help.output.find("buy <property_id> <seller> <buyer> <amount>"), std::string::npos);

    CommandResult one = Run("help propose");
    ASSERT_TRUE(one.success);
    EXPECT_EQ(one.output.rfind("propose <property_id> <description> [type]", 0), 0u);
}

TEST_F(CommandTableTest, EveryCommandHasCategoryAndDescription) {
    for (const auto& command : table_->GetCommands()) {
        EXPECT_FALSE(command.category.empty()) << command.name;
        EXPECT_FALSE(command.description.empty()) << command.name;
        EXPECT_TRUE(command.handler) << command.name;
    }
    EXPECT_EQ(table_->GetCommandsByCategory(Category::GOVERNANCE).size(), 4u);
    EXPECT_NE(table_->Find("holdings"), nullptr);
    EXPECT_EQ(table_->Find("nope"), nullptr);
}

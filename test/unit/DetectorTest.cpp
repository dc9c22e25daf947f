#include <gtest/gtest.h>
#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/Detectors.h"
#include "anchorscan/source/FieldRegistry.h"

#include <memory>

using namespace anchorscan;

class DetectorTest : public ::testing::Test {
protected:
    Config cfg = Config::defaults();

    static std::vector<Finding> run(const Detector &D, const std::string &src) {
        SourceFile file("lib.rs", src);
        ExtractionResult ER(file);
        std::vector<Finding> out;
        D.analyze(ER, out);
        return out;
    }

    // One init_if_needed token account, `extra` appended inside its block.
    static std::string tokenInit(const std::string &extra) {
        return "#[derive(Accounts)]\n"                    // 1
               "pub struct OpenDeposit<'info> {\n"        // 2
               "    #[account(mut)]\n"                    // 3
               "    pub payer: Signer<'info>,\n"          // 4
               "    #[account(\n"                         // 5
               "        init_if_needed,\n"                // 6
               "        payer = payer,\n"                 // 7
               "        token::mint = mint,\n"            // 8
               "        token::authority = authority,\n"  // 9
               + extra +
               "    )]\n"
               "    pub token_account: Account<'info, TokenAccount>,\n"
               "    pub mint: Account<'info, Mint>,\n"
               "    pub authority: Signer<'info>,\n"
               "}\n";
    }
};

// --- ANCHOR-001 -------------------------------------------------------------

TEST_F(DetectorTest, InitIfNeededWithoutChecksFlagged) {
    auto D = createInitIfNeededDetector(cfg);
    auto findings = run(*D, tokenInit(""));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].detectorID, "ANCHOR-001");
    EXPECT_EQ(findings[0].severity, Severity::High);
    EXPECT_EQ(findings[0].location.line, 5u);
    EXPECT_NE(findings[0].description.find("delegate, close_authority"), std::string::npos);
    EXPECT_NE(findings[0].description.find("'token_account'"), std::string::npos);
    EXPECT_NE(findings[0].codeSnippet.find(">>>    5 |"), std::string::npos);
    EXPECT_FALSE(findings[0].affectedVersions.empty());
    EXPECT_EQ(findings[0].reference, kDefaultReference);
}

TEST_F(DetectorTest, AssociatedTokenInitFlagged) {
    auto D = createInitIfNeededDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct OpenAta<'info> {\n"
        "    #[account(init_if_needed, payer = payer,\n"
        "              associated_token :: mint = mint,\n"
        "              associated_token::authority = payer)]\n"
        "    pub ata: Account<'info, TokenAccount>,\n"
        "}\n";
    auto findings = run(*D, src);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].location.line, 3u);
    EXPECT_EQ(findings[0].description.rfind("Associated token", 0), 0u);
}

TEST_F(DetectorTest, InitIfNeededDelegateCheckSuppresses) {
    auto D = createInitIfNeededDetector(cfg);
    EXPECT_TRUE(run(*D, tokenInit("        constraint = token_account.delegate.is_none(),\n")).empty());
    EXPECT_TRUE(run(*D, tokenInit("        constraint = token_account.close_authority == COption::None,\n")).empty());
    EXPECT_TRUE(run(*D, tokenInit("        constraint = token_account.delegate == None @ Err::Delegated,\n")).empty());
}

TEST_F(DetectorTest, InitIfNeededRequireAllChecks) {
    cfg.initIfNeededRequireAll = true;
    auto D = createInitIfNeededDetector(cfg);

    auto findings = run(*D, tokenInit("        constraint = token_account.delegate.is_none(),\n"));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_NE(findings[0].description.find("close_authority field."), std::string::npos);
    EXPECT_EQ(findings[0].description.find("delegate"), std::string::npos);

    EXPECT_TRUE(run(*D, tokenInit(
        "        constraint = token_account.delegate.is_none(),\n"
        "        constraint = token_account.close_authority.is_none(),\n")).empty());
}

TEST_F(DetectorTest, InitIfNeededWithoutTokenConstraintIgnored) {
    auto D = createInitIfNeededDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct Create<'info> {\n"
        "    #[account(init_if_needed, payer = payer, space = 8 + 32)]\n"
        "    pub vault: Account<'info, Vault>,\n"
        "    #[account(init, payer = payer, token::mint = mint)]\n"
        "    pub fresh: Account<'info, TokenAccount>,\n"
        "}\n";
    EXPECT_TRUE(run(*D, src).empty());
}

TEST_F(DetectorTest, InitIfNeededCompanionMustNameTheField) {
    auto D = createInitIfNeededDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"                                       // 1
        "pub struct Pair<'info> {\n"                                  // 2
        "    #[account(init_if_needed, payer = payer, token::mint = mint)]\n"  // 3
        "    pub first: Account<'info, TokenAccount>,\n"              // 4
        "    #[account(init_if_needed, payer = payer, token::mint = mint,\n"   // 5
        "              constraint = second.delegate.is_none())]\n"    // 6
        "    pub second: Account<'info, TokenAccount>,\n"             // 7
        "    #[account(constraint = first.close_authority.is_none())]\n"       // 8
        "    pub witness: Account<'info, Vault>,\n"                   // 9
        "}\n";
    // `second` is covered by its own block; `first` by the witness constraint
    // that names it.
    EXPECT_TRUE(run(*D, src).empty());

    std::string unrelated =
        "#[derive(Accounts)]\n"
        "pub struct Pair<'info> {\n"
        "    #[account(init_if_needed, payer = payer, token::mint = mint)]\n"
        "    pub first: Account<'info, TokenAccount>,\n"
        "    #[account(init_if_needed, payer = payer, token::mint = mint,\n"
        "              constraint = second.delegate.is_none())]\n"
        "    pub second: Account<'info, TokenAccount>,\n"
        "}\n";
    auto findings = run(*D, unrelated);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].location.line, 3u);
}

TEST_F(DetectorTest, InitIfNeededWindowStaysInsideStruct) {
    auto D = createInitIfNeededDetector(cfg);
    std::string src = tokenInit("") +
        "#[derive(Accounts)]\n"
        "pub struct Other<'info> {\n"
        "    #[account(constraint = token_account.delegate.is_none())]\n"
        "    pub token_account: Account<'info, TokenAccount>,\n"
        "}\n";
    EXPECT_EQ(run(*D, src).size(), 1u);
}

// --- ANCHOR-002 -------------------------------------------------------------

TEST_F(DetectorTest, DuplicateMutableSameElementType) {
    auto D = createDuplicateMutableDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"                                        // 1
        "pub struct Transfer<'info> {\n"                               // 2
        "    #[account(init_if_needed, payer = payer, space = 64)]\n"  // 3
        "    pub destination: Account<'info, Vault>,\n"                // 4
        "    #[account(mut)]\n"                                        // 5
        "    pub source: Box<Account<'info, Vault>>,\n"                // 6
        "    #[account(mut)]\n"                                        // 7
        "    pub spare: Account<'info, Vault>,\n"                      // 8
        "    #[account(mut)]\n"                                        // 9
        "    pub payer: Signer<'info>,\n"                              // 10
        "}\n";
    auto findings = run(*D, src);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].detectorID, "ANCHOR-002");
    EXPECT_EQ(findings[0].severity, Severity::Medium);
    EXPECT_EQ(findings[0].location.line, 4u);
    EXPECT_NE(findings[0].description.find("(Vault)"), std::string::npos);
    EXPECT_NE(findings[0].description.find("'source'"), std::string::npos);
}

TEST_F(DetectorTest, DuplicateMutableDifferentTypesIgnored) {
    auto D = createDuplicateMutableDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct Transfer<'info> {\n"
        "    #[account(init_if_needed, payer = payer, space = 64)]\n"
        "    pub destination: Account<'info, Vault>,\n"
        "    #[account(mut)]\n"
        "    pub source: Account<'info, Pool>,\n"
        "    #[account(mut)]\n"
        "    pub raw: AccountInfo<'info>,\n"
        "    #[account(immutable_marker)]\n"
        "    pub other: Account<'info, Vault>,\n"
        "}\n";
    EXPECT_TRUE(run(*D, src).empty());
}

TEST_F(DetectorTest, DuplicateMutableSeparateStructsIgnored) {
    auto D = createDuplicateMutableDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct A<'info> {\n"
        "    #[account(init_if_needed, payer = payer, space = 64)]\n"
        "    pub destination: Account<'info, Vault>,\n"
        "}\n"
        "#[derive(Accounts)]\n"
        "pub struct B<'info> {\n"
        "    #[account(mut)]\n"
        "    pub source: Account<'info, Vault>,\n"
        "}\n";
    EXPECT_TRUE(run(*D, src).empty());
}

// --- ANCHOR-003 -------------------------------------------------------------

static std::string reallocWithPayer(const std::string &payerDecl) {
    return "#[derive(Accounts)]\n"                 // 1
           "pub struct Resize<'info> {\n"          // 2
           "    #[account(\n"                      // 3
           "        mut,\n"                        // 4
           "        realloc = 200,\n"              // 5
           "        realloc::payer = payer,\n"     // 6
           "        realloc::zero = false,\n"      // 7
           "    )]\n"                              // 8
           "    pub data: Account<'info, Data>,\n" // 9
           + payerDecl +
           "}\n";
}

TEST_F(DetectorTest, ReallocPayerNotSignerFlagged) {
    auto D = createReallocPayerDetector(cfg);
    auto findings = run(*D, reallocWithPayer(
        "    #[account(mut)]\n"
        "    pub payer: AccountInfo<'info>,\n"));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].detectorID, "ANCHOR-003");
    EXPECT_EQ(findings[0].location.line, 6u);
    EXPECT_NE(findings[0].description.find("typed as 'AccountInfo<'info>'"), std::string::npos);
}

TEST_F(DetectorTest, ReallocPayerSignerSafe) {
    auto D = createReallocPayerDetector(cfg);
    EXPECT_TRUE(run(*D, reallocWithPayer(
        "    #[account(mut)]\n"
        "    pub payer: Signer<'info>,\n")).empty());
    EXPECT_TRUE(run(*D, reallocWithPayer(
        "    #[account(mut, signer)]\n"
        "    pub payer: AccountInfo<'info>,\n")).empty());
}

TEST_F(DetectorTest, ReallocPayerUnknownSkipped) {
    auto D = createReallocPayerDetector(cfg);
    EXPECT_TRUE(run(*D, reallocWithPayer(
        "    pub someone_else: AccountInfo<'info>,\n")).empty());
    EXPECT_TRUE(run(*D, reallocWithPayer(
        "    pub payer: Account<'info, Vault>>,\n")).empty());
}

TEST_F(DetectorTest, ReallocPayerDocMentionDoesNotCount) {
    auto D = createReallocPayerDetector(cfg);
    auto findings = run(*D, reallocWithPayer(
        "    /// should be a signer\n"
        "    #[account(mut)]\n"
        "    pub payer: AccountInfo<'info>,\n"));
    EXPECT_EQ(findings.size(), 1u);
}

// --- ANCHOR-004 / ANCHOR-006 ------------------------------------------------

static std::string rawHandle(const std::string &lead, const std::string &name,
                             const std::string &type = "AccountInfo<'info>") {
    return "#[derive(Accounts)]\n"                  // 1
           "pub struct Read<'info> {\n"             // 2
           "    pub authority: Signer<'info>,\n"    // 3
           + lead +
           "    pub " + name + ": " + type + ",\n"
           "}\n";
}

TEST_F(DetectorTest, RawHandleFlaggedByBothRules) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);
    std::string src = rawHandle("    /// price source\n", "price_feed");

    auto a = run(*cosplay, src);
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].detectorID, "ANCHOR-004");
    EXPECT_EQ(a[0].severity, Severity::Medium);
    EXPECT_EQ(a[0].location.line, 5u);

    auto b = run(*owner, src);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].detectorID, "ANCHOR-006");
    EXPECT_EQ(b[0].severity, Severity::High);
    EXPECT_NE(b[0].description.find("'price_feed'"), std::string::npos);
}

TEST_F(DetectorTest, RawHandleAllowListedProgramIgnored) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);
    for (const char *name : {"token_program", "system_program", "program",
                             "my_custom_program", "Rent_"}) {
        std::string src = rawHandle("", name);
        EXPECT_TRUE(run(*cosplay, src).empty()) << name;
        EXPECT_TRUE(run(*owner, src).empty()) << name;
    }
}

TEST_F(DetectorTest, RawHandleAllowListsDiffer) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);

    std::string authority = rawHandle("", "authority");
    EXPECT_TRUE(run(*cosplay, authority).empty());
    EXPECT_EQ(run(*owner, authority).size(), 1u);

    std::string sysvar = rawHandle("", "sysvar_clock");
    EXPECT_EQ(run(*cosplay, sysvar).size(), 1u);
    EXPECT_TRUE(run(*owner, sysvar).empty());
}

TEST_F(DetectorTest, RawHandleSafeMarkersSuppress) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);
    const char *leads[] = {
        "    /// CHECK: validated in the handler\n",
        "    #[account(owner = oracle::ID)]\n",
        "    #[account(constraint = feed.owner == &oracle::ID)]\n",
        "    #[account(signer)]\n",
    };
    for (const char *lead : leads) {
        std::string src = rawHandle(lead, "feed");
        EXPECT_TRUE(run(*cosplay, src).empty()) << lead;
        EXPECT_TRUE(run(*owner, src).empty()) << lead;
    }
}

TEST_F(DetectorTest, OwnerRuleReadsOnlyLeadingLines) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);

    std::string named = rawHandle("", "signer");
    auto a = run(*owner, named);
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].location.line, 4u);
    EXPECT_TRUE(run(*cosplay, named).empty());

    std::string trailing =
        "#[derive(Accounts)]\n"
        "pub struct Read<'info> {\n"
        "    pub feed: AccountInfo<'info>, // signer checked in handler\n"
        "}\n";
    EXPECT_EQ(run(*owner, trailing).size(), 1u);
    EXPECT_TRUE(run(*cosplay, trailing).empty());
}

TEST_F(DetectorTest, RawHandleMarkerOnPreviousFieldDoesNotLeak) {
    auto owner = createMissingOwnerDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct Read<'info> {\n"
        "    /// CHECK: fine\n"
        "    pub checked: AccountInfo<'info>,\n"
        "    pub unchecked: AccountInfo<'info>,\n"
        "}\n";
    auto findings = run(*owner, src);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].location.line, 5u);
}

TEST_F(DetectorTest, UncheckedAccountDowngraded) {
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);
    std::string src = rawHandle("", "destination", "UncheckedAccount<'info>");

    auto a = run(*cosplay, src);
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].severity, Severity::Low);
    auto b = run(*owner, src);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].severity, Severity::Low);

    cfg.downgradeUncheckedHandles = false;
    auto strict = createMissingOwnerDetector(cfg);
    auto c = run(*strict, src);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].severity, Severity::High);
}

TEST_F(DetectorTest, ExtraAllowedFields) {
    cfg.extraAllowedFields = {"oracle"};
    auto cosplay = createTypeCosplayDetector(cfg);
    auto owner = createMissingOwnerDetector(cfg);
    std::string src = rawHandle("", "oracle_");
    EXPECT_TRUE(run(*cosplay, src).empty());
    EXPECT_TRUE(run(*owner, src).empty());
}

TEST_F(DetectorTest, RawHandleWindowIsBounded) {
    cfg.rawHandleWindow = 2;
    auto owner = createMissingOwnerDetector(cfg);
    std::string src = rawHandle(
        "    /// CHECK: far above\n"
        "    /// line\n"
        "    /// line\n"
        "    /// line\n", "feed");
    EXPECT_EQ(run(*owner, src).size(), 1u);
}

// --- ANCHOR-005 -------------------------------------------------------------

static constexpr const char *kCloseReinit =
    "#[derive(Accounts)]\n"                                         // 1
    "pub struct CreateVault<'info> {\n"                             // 2
    "    #[account(init_if_needed, payer = payer, space = 48)]\n"   // 3
    "    pub vault: Account<'info, Vault>,\n"                       // 4
    "}\n"                                                           // 5
    "#[derive(Accounts)]\n"                                         // 6
    "pub struct CloseVault<'info> {\n"                              // 7
    "    #[account(mut, close = authority, has_one = authority)]\n" // 8
    "    pub vault: Account<'info, Vault>,\n"                       // 9
    "    #[account(mut, close = authority)]\n"                      // 10
    "    pub pool: Account<'info, Pool>,\n"                         // 11
    "}\n";

TEST_F(DetectorTest, CloseReinitAcrossStructs) {
    auto D = createCloseReinitDetector(cfg);
    auto findings = run(*D, kCloseReinit);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].detectorID, "ANCHOR-005");
    EXPECT_EQ(findings[0].location.line, 4u);
    EXPECT_NE(findings[0].description.find("'Vault'"), std::string::npos);
    EXPECT_NE(findings[0].description.find("CloseVault.vault, line 9"), std::string::npos);
    EXPECT_NE(findings[0].description.find("CreateVault.vault, line 4"), std::string::npos);
}

TEST_F(DetectorTest, CloseReinitStructScope) {
    cfg.closeReinitScope = CloseReinitScope::Struct;
    auto D = createCloseReinitDetector(cfg);
    EXPECT_TRUE(run(*D, kCloseReinit).empty());

    std::string same =
        "#[derive(Accounts)]\n"
        "pub struct Cycle<'info> {\n"
        "    #[account(mut, close = authority)]\n"
        "    pub old: Account<'info, Vault>,\n"
        "    #[account(init_if_needed, payer = authority, space = 48)]\n"
        "    pub fresh: Account<'info, Vault>,\n"
        "}\n";
    auto findings = run(*D, same);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].location.line, 6u);
}

TEST_F(DetectorTest, CloseWordBoundary) {
    auto D = createCloseReinitDetector(cfg);
    std::string src =
        "#[derive(Accounts)]\n"
        "pub struct S<'info> {\n"
        "    #[account(init_if_needed, payer = p, space = 48)]\n"
        "    pub vault: Account<'info, Vault>,\n"
        "    #[account(mut, constraint = vault.autoclose == false)]\n"
        "    pub other: Account<'info, Vault>,\n"
        "}\n";
    EXPECT_TRUE(run(*D, src).empty());
}

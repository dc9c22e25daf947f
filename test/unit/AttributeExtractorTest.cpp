#include <gtest/gtest.h>
#include "anchorscan/source/AttributeExtractor.h"
#include "anchorscan/source/FieldRegistry.h"
#include "anchorscan/source/TextUtils.h"

using namespace anchorscan;

class AttributeExtractorTest : public ::testing::Test {
protected:
    static std::vector<AttributeBlock> extract(const std::string &text) {
        SourceFile file("lib.rs", text);
        return AttributeExtractor().extract(file);
    }
};

TEST_F(AttributeExtractorTest, CapturesMultiLineBlockWhole) {
    auto blocks = extract(
        "#[derive(Accounts)]\n"
        "pub struct Init<'info> {\n"
        "    #[account(\n"
        "        init_if_needed,\n"
        "        payer = payer,\n"
        "        seeds = [b\"vault\", payer.key().as_ref()],\n"
        "        bump,\n"
        "    )]\n"
        "    pub vault: Account<'info, Vault>,\n"
        "}\n");

    ASSERT_EQ(blocks.size(), 1u);
    const auto &b = blocks[0];
    EXPECT_EQ(b.startLine, 3u);
    EXPECT_EQ(b.endLine, 8u);
    EXPECT_NE(b.text.find("init_if_needed"), std::string::npos);
    EXPECT_NE(b.text.find("bump"), std::string::npos);
    EXPECT_EQ(delimiterBalance(b.text, '(', ')'), 0);
    EXPECT_EQ(delimiterBalance(b.text, '[', ']'), 0);
}

TEST_F(AttributeExtractorTest, BalancedAcrossManyShapes) {
    const char *samples[] = {
        "#[account(mut)] pub a: Signer<'info>,",
        "#[account(seeds = [b\")\"], bump)]",
        "#[account(constraint = a.key() == r#\")\"#.parse().unwrap())]",
        "#[account(constraint = check(a, (b, c)) @ Err::X /* ) */)]",
        "#[account(\n  mut,\n  has_one = owner, // )\n)]",
    };
    for (const char *src : samples) {
        auto blocks = extract(src);
        ASSERT_EQ(blocks.size(), 1u) << src;
        // Re-wrapped body closes exactly at its last character.
        std::string wrapped = "(" + blocks[0].text + ")";
        auto close = findClosing(wrapped, 0, '(', ')');
        ASSERT_TRUE(close.has_value()) << src;
        EXPECT_EQ(*close, wrapped.size() - 1) << src;
        EXPECT_EQ(delimiterBalance(blocks[0].text, '(', ')'), 0) << src;
        EXPECT_EQ(delimiterBalance(blocks[0].text, '[', ']'), 0) << src;
    }
    auto blocks = extract("#[account(seeds = [b\")\"], bump)]");
    EXPECT_EQ(blocks[0].text, "seeds = [b\")\"], bump");
}

TEST_F(AttributeExtractorTest, SkipsDataAccountMarker) {
    auto blocks = extract(
        "#[account]\n"
        "pub struct Vault {\n"
        "    pub balance: u64,\n"
        "}\n");
    EXPECT_TRUE(blocks.empty());
}

TEST_F(AttributeExtractorTest, SkipsMarkersInCommentsAndStrings) {
    auto blocks = extract(
        "// #[account(mut)]\n"
        "/* #[account(init)] */\n"
        "const S: &str = \"#[account(mut)]\";\n");
    EXPECT_TRUE(blocks.empty());
}

TEST_F(AttributeExtractorTest, SkipsLongerAttributeNames) {
    auto blocks = extract("#[accounts(mut)]\n#[account_info(x)]\n");
    EXPECT_TRUE(blocks.empty());
}

TEST_F(AttributeExtractorTest, DropsUnterminatedBlockKeepsEarlierOnes) {
    auto blocks = extract(
        "#[account(mut)]\n"
        "pub a: Signer<'info>,\n"
        "#[account(init_if_needed, token::mint = mint,\n"
        "pub b: Account<'info, TokenAccount>,\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "mut");
    EXPECT_EQ(blocks[0].startLine, 1u);
}

TEST_F(AttributeExtractorTest, WhitespaceBeforeParenthesis) {
    auto blocks = extract("#[account (mut, signer)]");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "mut, signer");
}

TEST_F(AttributeExtractorTest, BodyOffsetMapsToLines) {
    auto blocks = extract(
        "#[account(\n"
        "    mut,\n"
        "    realloc::payer = payer,\n"
        ")]");
    ASSERT_EQ(blocks.size(), 1u);
    size_t off = blocks[0].text.find("realloc");
    EXPECT_EQ(blocks[0].lineOfBodyOffset(off), 3u);
}

TEST_F(AttributeExtractorTest, BlocksInsideStructsCarryStructName) {
    SourceFile file("lib.rs",
        "#[account(mut)]\n"
        "pub stray: u8,\n"
        "#[derive(Accounts)]\n"
        "pub struct Deposit<'info> {\n"
        "    #[account(mut)]\n"
        "    pub payer: Signer<'info>,\n"
        "}\n");
    ExtractionResult ER(file);
    ASSERT_EQ(ER.blocks().size(), 2u);
    EXPECT_EQ(ER.blocks()[0].structName, "");
    EXPECT_EQ(ER.blocks()[1].structName, "Deposit");
}

#include <gtest/gtest.h>

#include "../src/lexer/lexer.hpp"

#include <string>
#include <vector>

using models::TokenKind;

namespace {
std::vector<TokenKind> Kinds(const std::vector<models::Token> &tokens) {
  std::vector<TokenKind> kinds;
  for (const auto &token : tokens) {
    kinds.push_back(token.kind);
  }
  return kinds;
}

std::size_t ErrorOffset(const std::string &statement) {
  try {
    lexer::Tokenize(statement);
  } catch (const lexer::LexError &error) {
    return error.GetOffset();
  }
  ADD_FAILURE() << "no LexError for " << statement;
  return 0;
}
} // namespace

TEST(LexerTest, Tokenize_ComponentStatement_ProducesTypedTokens) {
  auto tokens = lexer::Tokenize("\\draw (0,0) to[R, l=$R_1$] (2,0);");

  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_EQ(Kinds(tokens),
            (std::vector<TokenKind>{TokenKind::kKeyword, TokenKind::kCoordinate,
                                    TokenKind::kPathOp, TokenKind::kOptionBlock,
                                    TokenKind::kCoordinate,
                                    TokenKind::kDelimiter}));
  EXPECT_EQ(tokens[0].lexeme, "\\draw");
  EXPECT_EQ(tokens[1].lexeme, "(0,0)");
  EXPECT_EQ(tokens[1].offset, 6u);
  EXPECT_EQ(tokens[2].lexeme, "to");
  EXPECT_EQ(tokens[3].lexeme, "[R, l=$R_1$]");
  EXPECT_EQ(tokens[3].offset, 14u);
  EXPECT_EQ(tokens[3].Body(), "R, l=$R_1$");
  EXPECT_EQ(tokens[4].offset, 27u);
  EXPECT_EQ(tokens[5].offset, 32u);
}

TEST(LexerTest, Tokenize_RelativeCoordinates_KeepPrefix) {
  auto tokens = lexer::Tokenize("\\draw (0,0) -- ++(1,0) -- +(0,1)");

  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_EQ(tokens[3].lexeme, "++(1,0)");
  EXPECT_TRUE(tokens[3].IsRelative());
  EXPECT_EQ(tokens[3].Body(), "1,0");
  EXPECT_EQ(tokens[5].lexeme, "+(0,1)");
  EXPECT_TRUE(tokens[5].IsRelative());
  EXPECT_FALSE(tokens[1].IsRelative());
}

TEST(LexerTest, Tokenize_OrthogonalConnectors_ArePathOps) {
  auto tokens = lexer::Tokenize("\\draw (0,0) -| (1,1) |- (2,0);");

  ASSERT_EQ(tokens.size(), 7u);
  EXPECT_TRUE(tokens[2].Is(TokenKind::kPathOp, "-|"));
  EXPECT_TRUE(tokens[4].Is(TokenKind::kPathOp, "|-"));
}

TEST(LexerTest, Tokenize_TextWithNestedBracesAndMath_IsOneToken) {
  auto tokens = lexer::Tokenize("\\node at (0,0) {\\textbf{a}  $x_{1}$};");

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[1].lexeme, "at");
  EXPECT_EQ(tokens[1].kind, TokenKind::kKeyword);
  EXPECT_EQ(tokens[3].kind, TokenKind::kText);
  EXPECT_EQ(tokens[3].lexeme, "{\\textbf{a}  $x_{1}$}");
}

TEST(LexerTest, Tokenize_NestedBracketsInOptions_AreTracked) {
  auto tokens = lexer::Tokenize("\\draw[a=[b], c={[d]}] (0,0) -- (1,0);");

  ASSERT_GE(tokens.size(), 2u);
  EXPECT_EQ(tokens[1].lexeme, "[a=[b], c={[d]}]");
}

TEST(LexerTest, Tokenize_ScopeCommand_IsOneKeyword) {
  auto tokens = lexer::Tokenize("\\begin{scope}[xshift=1cm]");

  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_TRUE(tokens[0].Is(TokenKind::kKeyword, "\\begin{scope}"));
  EXPECT_EQ(tokens[1].kind, TokenKind::kOptionBlock);
}

TEST(LexerTest, Tokenize_CycleAndNodeWords_AreKeywords) {
  auto tokens =
      lexer::Tokenize("\\draw (0,0) -- (1,0) node[right] {x} -- cycle;");

  ASSERT_EQ(tokens.size(), 10u);
  EXPECT_TRUE(tokens[4].Is(TokenKind::kKeyword, "node"));
  EXPECT_TRUE(tokens[8].Is(TokenKind::kKeyword, "cycle"));
}

TEST(LexerTest, Lex_AfterEnd_KeepsReturningNothing) {
  lexer::Lexer lexer("\\draw");

  auto first = lexer.lex();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->kind, TokenKind::kKeyword);
  EXPECT_FALSE(lexer.lex().has_value());
  EXPECT_FALSE(lexer.lex().has_value());
}

TEST(LexerTest, Tokenize_MissingBracket_ThrowsAtBracket) {
  EXPECT_EQ(ErrorOffset("\\draw (0,0) to[R (2,0);"), 14u);
}

TEST(LexerTest, Tokenize_MissingBrace_ThrowsAtBrace) {
  EXPECT_EQ(ErrorOffset("\\node at (0,0) {abc;"), 15u);
}

TEST(LexerTest, Tokenize_UnterminatedMath_ThrowsAtDollar) {
  EXPECT_EQ(ErrorOffset("\\node at (0,0) {$x};"), 16u);
}

TEST(LexerTest, Tokenize_UnterminatedMathInOptions_ThrowsAtDollar) {
  EXPECT_EQ(ErrorOffset("\\draw (0,0) to[R, l=$R_1] (2,0);"), 20u);
}

TEST(LexerTest, Tokenize_MathInOptions_IsPartOfBlock) {
  auto tokens = lexer::Tokenize("\\draw (0,0) to[R, l=$[R_1]$] (2,0);");

  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_TRUE(tokens[3].Is(TokenKind::kOptionBlock, "[R, l=$[R_1]$]"));
}

TEST(LexerTest, Tokenize_StrayClosingParenthesis_Throws) {
  EXPECT_EQ(ErrorOffset("\\draw (0,0) -- (1,0));"), 20u);
}

TEST(LexerTest, Tokenize_UnclosedCoordinate_ThrowsAtParenthesis) {
  EXPECT_EQ(ErrorOffset("\\draw (0,0 -- (1,0);"), 6u);
}

TEST(LexerTest, Tokenize_RelativePrefixWithoutCoordinate_Throws) {
  EXPECT_EQ(ErrorOffset("\\draw (0,0) + (1,0)"), 12u);
}

TEST(LexerTest, Tokenize_UnknownCharacter_Throws) {
  EXPECT_THROW(lexer::Tokenize("@"), lexer::LexError);
  EXPECT_THROW(lexer::Tokenize("\\ (0,0)"), lexer::LexError);
}

TEST(LexerTest, Tokenize_EmptyStatement_ReturnsNoTokens) {
  EXPECT_TRUE(lexer::Tokenize("   ").empty());
}

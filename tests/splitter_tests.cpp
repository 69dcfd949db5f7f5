#include <gtest/gtest.h>

#include "../src/lexer/splitter.hpp"

TEST(SplitterTest, SplitStatements_TwoStatements_TrimsBlanks) {
  auto statements = lexer::SplitStatements(
      "\\draw (0,0) -- (1,0);\n\\node at (0,0) {a;b};");

  ASSERT_EQ(statements.size(), 2u);
  EXPECT_EQ(statements[0].text, "\\draw (0,0) -- (1,0);");
  EXPECT_EQ(statements[1].text, "\\node at (0,0) {a;b};");
}

TEST(SplitterTest, SplitStatements_SemicolonInsideBracedOption_DoesNotSplit) {
  auto statements = lexer::SplitStatements(
      "\\draw[draw={rgb,255:red,1;green,2;blue,3}] (0,0) -- (1,0);");

  ASSERT_EQ(statements.size(), 1u);
}

TEST(SplitterTest, SplitStatements_Scope_MarkersAreOwnStatements) {
  auto statements = lexer::SplitStatements(
      "\\begin{scope}[name=left]\n\\draw (0,0) -- (1,0);\n\\end{scope}");

  ASSERT_EQ(statements.size(), 3u);
  EXPECT_EQ(statements[0].text, "\\begin{scope}[name=left]");
  EXPECT_EQ(statements[1].text, "\\draw (0,0) -- (1,0);");
  EXPECT_EQ(statements[2].text, "\\end{scope}");
}

TEST(SplitterTest, SplitStatements_UnclosedBracket_ResynchronizesAtNextCommand) {
  auto statements = lexer::SplitStatements(
      "\\draw (0,0) to[R (2,0);\n\\draw (0,0) -- (1,0);");

  ASSERT_EQ(statements.size(), 2u);
  EXPECT_EQ(statements[0].text, "\\draw (0,0) to[R (2,0);");
  EXPECT_EQ(statements[1].text, "\\draw (0,0) -- (1,0);");
}

TEST(SplitterTest, SplitStatements_UnclosedBrace_ResynchronizesAtLineStart) {
  auto statements = lexer::SplitStatements(
      "\\node[ground] at (0,0) {abc;\n\\draw (0,0) -- (1,0);\n"
      "  \\draw (1,0) -- (2,0);");

  ASSERT_EQ(statements.size(), 3u);
  EXPECT_EQ(statements[0].text, "\\node[ground] at (0,0) {abc;");
  EXPECT_EQ(statements[1].text, "\\draw (0,0) -- (1,0);");
  EXPECT_EQ(statements[2].text, "\\draw (1,0) -- (2,0);");
}

TEST(SplitterTest, SplitStatements_CommandInsideBraceMidLine_DoesNotSplit) {
  auto statements = lexer::SplitStatements(
      "\\node at (0,0) {see \\node here};\n\\draw (0,0) -- (1,0);");

  ASSERT_EQ(statements.size(), 2u);
  EXPECT_EQ(statements[0].text, "\\node at (0,0) {see \\node here};");
}

TEST(SplitterTest, SplitStatements_MissingFinalSemicolon_KeepsStatement) {
  auto statements = lexer::SplitStatements("\\draw (0,0) -- (1,0)  ");

  ASSERT_EQ(statements.size(), 1u);
  EXPECT_EQ(statements[0].text, "\\draw (0,0) -- (1,0)");
}

TEST(SplitterTest, SplitStatements_BlankBody_ReturnsNothing) {
  EXPECT_TRUE(lexer::SplitStatements("  \n\t ").empty());
  EXPECT_TRUE(lexer::SplitStatements("").empty());
}

TEST(SplitterTest, RemoveComments_EscapedPercent_IsKept) {
  EXPECT_EQ(lexer::RemoveComments("a % comment\nb \\% kept"), "a \nb \\% kept");
}

TEST(SplitterTest, ExtractDrawingBody_Circuitikz_ReturnsBody) {
  auto body = lexer::ExtractDrawingBody(
      "\\documentclass{standalone}\n\\begin{document}\n\\begin{circuitikz}"
      "\n\\draw (0,0) -- (1,0);\n\\end{circuitikz}\n\\end{document}");

  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "\n\\draw (0,0) -- (1,0);\n");
}

TEST(SplitterTest, ExtractDrawingBody_Tikzpicture_ReturnsBody) {
  auto body = lexer::ExtractDrawingBody(
      "\\begin{tikzpicture}\\node at (0,0) {x};\\end{tikzpicture}");

  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "\\node at (0,0) {x};");
}

TEST(SplitterTest, ExtractDrawingBody_NoEnvironment_ReturnsNullopt) {
  EXPECT_FALSE(lexer::ExtractDrawingBody("\\draw (0,0) -- (1,0);").has_value());
  EXPECT_FALSE(
      lexer::ExtractDrawingBody("\\begin{circuitikz} \\draw (0,0) -- (1,0);")
          .has_value());
}

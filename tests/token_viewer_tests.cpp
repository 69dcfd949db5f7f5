#include <gtest/gtest.h>

#include "../src/lexer/lexer.hpp"
#include "../src/utils/format/token_viewer.hpp"

#include <sstream>

TEST(TokenViewerTest, View_IndentsInsideGroups) {
  std::ostringstream out;
  format::TokenViewer viewer(out);

  viewer.view(0, "\\begin{scope}", lexer::Tokenize("\\begin{scope}"),
              classifier::StatementKind::kGroupOpen);
  viewer.view(1, "\\draw (0,0) -- (1,0);",
              lexer::Tokenize("\\draw (0,0) -- (1,0);"),
              classifier::StatementKind::kSimpleWire);
  viewer.view(2, "\\end{scope}", lexer::Tokenize("\\end{scope}"),
              classifier::StatementKind::kGroupClose);

  auto text = out.str();
  EXPECT_NE(text.find("#0 GroupOpen: \\begin{scope}\n"), std::string::npos);
  EXPECT_NE(text.find("   #1 SimpleWire: \\draw (0,0) -- (1,0);\n"),
            std::string::npos);
  EXPECT_NE(text.find("        6  coordinate  (0,0)\n"), std::string::npos);
  EXPECT_NE(text.find("\n#2 GroupClose: \\end{scope}\n"), std::string::npos);
}

#include <gtest/gtest.h>

#include "../src/builder/name_table.hpp"
#include "../src/builder/scope.hpp"

class ScopeProcessorTest : public ::testing::Test {
protected:
  builder::ScopeProcessor scopes_;
};

TEST_F(ScopeProcessorTest, GetCurrScope_Initially_ReturnsDocumentScope) {
  EXPECT_EQ(scopes_.GetCurrScope(), 0u);
  EXPECT_EQ(scopes_.GetVisibleScopes(), (std::vector<std::size_t>{0}));
}

TEST_F(ScopeProcessorTest, AddScope_NestsInsideCurrentScope) {
  auto outer = scopes_.AddScope();
  auto inner = scopes_.AddScope();

  EXPECT_EQ(outer, 1u);
  EXPECT_EQ(inner, 2u);
  EXPECT_EQ(scopes_.GetCurrScope(), 2u);
  EXPECT_EQ(scopes_.GetVisibleScopes(), (std::vector<std::size_t>{2, 1, 0}));
}

TEST_F(ScopeProcessorTest, RemoveScope_SiblingGetsFreshId) {
  scopes_.AddScope();
  auto closed = scopes_.RemoveScope();
  auto sibling = scopes_.AddScope();

  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(*closed, 1u);
  EXPECT_EQ(sibling, 2u);
  EXPECT_EQ(scopes_.GetVisibleScopes(), (std::vector<std::size_t>{2, 0}));
}

TEST_F(ScopeProcessorTest, RemoveScope_AtDocumentScope_ReturnsNullopt) {
  EXPECT_FALSE(scopes_.RemoveScope().has_value());
  EXPECT_EQ(scopes_.GetCurrScope(), 0u);
}

TEST_F(ScopeProcessorTest, ForceClose_ClosesInnermostFirst) {
  scopes_.AddScope();
  scopes_.AddScope();

  auto closed = scopes_.ForceClose();

  EXPECT_EQ(closed, (std::vector<std::size_t>{2, 1}));
  EXPECT_EQ(scopes_.GetCurrScope(), 0u);
  EXPECT_TRUE(scopes_.ForceClose().empty());
}

TEST(NameTableTest, Lookup_InnermostDeclarationWins) {
  builder::NameTable names;
  names.Declare(0, "A", {1, std::nullopt, 0});
  names.Declare(1, "A", {4, std::nullopt, 3});

  auto inner = names.Lookup("A", {1, 0});
  auto outer = names.Lookup("A", {0});

  ASSERT_TRUE(inner.has_value());
  EXPECT_EQ(inner->element, 4u);
  ASSERT_TRUE(outer.has_value());
  EXPECT_EQ(outer->element, 1u);
  EXPECT_FALSE(names.Lookup("A", {2}).has_value());
  EXPECT_FALSE(names.Lookup("B", {1, 0}).has_value());
}

TEST(NameTableTest, Declare_SameScope_KeepsEveryDeclaration) {
  builder::NameTable names;
  names.Declare(0, "A", {1, std::nullopt, 0});
  names.Declare(0, "A", {2, 3, 4});

  auto latest = names.Lookup("A", {0});
  auto before = names.Lookup("A", {0}, 2);
  auto after = names.Lookup("A", {0}, 4);

  EXPECT_EQ(names.Size(), 1u);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->element, 2u);
  EXPECT_EQ(latest->point, 3u);
  ASSERT_TRUE(before.has_value());
  EXPECT_EQ(before->element, 1u);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->element, 2u);
}

TEST(NameTableTest, Lookup_NothingEarlier_FallsBackToFirstLaterDeclaration) {
  builder::NameTable names;
  names.Declare(0, "A", {5, std::nullopt, 5});
  names.Declare(0, "A", {3, std::nullopt, 3});

  auto target = names.Lookup("A", {0}, 1);

  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->element, 3u);
}

TEST(NameTableTest, Lookup_EarlierOuterBeatsLaterInner) {
  builder::NameTable names;
  names.Declare(0, "A", {0, std::nullopt, 0});
  names.Declare(1, "A", {6, std::nullopt, 6});

  auto target = names.Lookup("A", {1, 0}, 2);

  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->element, 0u);
}

TEST(NameTableTest, Remap_KeepsSurvivingRedeclaration) {
  builder::NameTable names;
  names.Declare(0, "A", {0, std::nullopt, 0});
  names.Declare(0, "A", {1, std::nullopt, 1});

  names.Remap({std::nullopt, 0});

  EXPECT_EQ(names.Size(), 1u);
  EXPECT_EQ(names.Lookup("A", {0}, 0)->element, 0u);
}

TEST(NameTableTest, Remap_RenumbersAndForgetsRemoved) {
  builder::NameTable names;
  names.Declare(0, "A", {0, std::nullopt, 0});
  names.Declare(0, "B", {1, std::nullopt, 1});
  names.Declare(0, "C", {2, std::nullopt, 2});

  names.Remap({0, std::nullopt, 1});

  EXPECT_EQ(names.Size(), 2u);
  EXPECT_EQ(names.Lookup("A", {0})->element, 0u);
  EXPECT_FALSE(names.Lookup("B", {0}).has_value());
  EXPECT_EQ(names.Lookup("C", {0})->element, 1u);
}

#include <gtest/gtest.h>

#include "../src/builder/deferred.hpp"

#include <string>
#include <utility>

using document::DiagnosticKind;
using models::Coordinate;
using models::CoordinateKind;
using models::Point;

namespace {
Coordinate Absolute(double x, double y) {
  Coordinate coordinate;
  coordinate.value = Point{x, y};
  return coordinate;
}

Coordinate Named(const std::string &name, const std::string &anchor = "") {
  Coordinate coordinate;
  coordinate.kind = CoordinateKind::kNamed;
  coordinate.name = name;
  coordinate.anchor = anchor;
  return coordinate;
}

Coordinate Relative(const std::string &name, double dx, double dy) {
  Coordinate coordinate;
  coordinate.kind = CoordinateKind::kRelative;
  coordinate.name = name;
  coordinate.value = Point{dx, dy};
  return coordinate;
}

models::Element NodeAt(Coordinate position, std::size_t statement) {
  models::Node node;
  node.position = std::move(position);
  models::Element element;
  element.body = std::move(node);
  element.statement_index = statement;
  element.visible_scopes = {0};
  return element;
}

models::Element WireThrough(std::vector<Coordinate> coordinates,
                            std::size_t statement) {
  models::Wire wire;
  for (auto &coordinate : coordinates) {
    wire.points.push_back({std::move(coordinate), std::nullopt});
  }
  wire.directions.assign(wire.points.size() - 1, "--");
  models::Element element;
  element.body = std::move(wire);
  element.statement_index = statement;
  element.visible_scopes = {0};
  return element;
}

Point Resolved(const models::Element &element, std::size_t point = 0) {
  return *element.Coordinates().at(point)->resolved;
}
} // namespace

class DeferredResolverTest : public ::testing::Test {
protected:
  std::size_t Add(models::Element element, const std::string &name = "") {
    document_.elements.push_back(std::move(element));
    auto index = document_.elements.size() - 1;
    if (!name.empty()) {
      names_.Declare(0, name,
                     {index, std::nullopt,
                      document_.elements[index].statement_index});
    }
    return index;
  }

  std::size_t ResolveAll() {
    builder::DeferredResolver resolver(document_, names_);
    return resolver.ResolveAll();
  }

  document::Document document_;
  builder::NameTable names_;
};

TEST_F(DeferredResolverTest, ResolveAll_ForwardReference_Resolves) {
  Add(WireThrough({Named("A"), Absolute(0, 0)}, 0));
  Add(NodeAt(Absolute(1, 2), 1), "A");

  EXPECT_EQ(ResolveAll(), 0u);
  ASSERT_EQ(document_.elements.size(), 2u);
  EXPECT_EQ(Resolved(document_.elements[0]), (Point{1, 2}));
  EXPECT_TRUE(document_.diagnostics.empty());
}

TEST_F(DeferredResolverTest, ResolveAll_ShiftAndRelative_AddUp) {
  Add(NodeAt(Absolute(1, 1), 0), "A");
  auto shifted = Named("A");
  shifted.shift = Point{0.5, 0};
  Add(WireThrough({shifted, Relative("A", 0, 2)}, 1));

  ResolveAll();

  EXPECT_EQ(Resolved(document_.elements[1], 0), (Point{1.5, 1}));
  EXPECT_EQ(Resolved(document_.elements[1], 1), (Point{1, 3}));
}

TEST_F(DeferredResolverTest, ResolveAll_UndefinedName_DropsWithOneDiagnostic) {
  Add(NodeAt(Absolute(0, 0), 0), "A");
  Add(WireThrough({Named("A"), Named("missing")}, 1));

  EXPECT_EQ(ResolveAll(), 1u);

  ASSERT_EQ(document_.elements.size(), 1u);
  ASSERT_EQ(document_.diagnostics.size(), 1u);
  const auto &diagnostic = document_.diagnostics.front();
  EXPECT_EQ(diagnostic.kind, DiagnosticKind::kUnresolvedReference);
  EXPECT_EQ(diagnostic.statement_index, 1u);
  EXPECT_EQ(diagnostic.message,
            "wire dropped: name 'missing' is not defined in any visible scope");
}

TEST_F(DeferredResolverTest, ResolveAll_Cycle_DropsBoth) {
  Add(NodeAt(Named("B"), 0), "A");
  Add(NodeAt(Named("A"), 1), "B");

  EXPECT_EQ(ResolveAll(), 2u);

  EXPECT_TRUE(document_.elements.empty());
  EXPECT_EQ(document_.diagnostics.size(), 2u);
  EXPECT_EQ(names_.Size(), 0u);
}

TEST_F(DeferredResolverTest, ResolveAll_DependentOfDroppedElement_IsDropped) {
  Add(NodeAt(Named("nowhere"), 0), "A");
  Add(WireThrough({Absolute(0, 0), Named("A")}, 1));
  Add(NodeAt(Absolute(3, 3), 2), "C");

  EXPECT_EQ(ResolveAll(), 2u);

  ASSERT_EQ(document_.elements.size(), 1u);
  EXPECT_EQ(Resolved(document_.elements[0]), (Point{3, 3}));
  EXPECT_EQ(names_.Lookup("C", {0})->element, 0u);
  ASSERT_EQ(document_.diagnostics.size(), 2u);
  EXPECT_EQ(document_.diagnostics[1].message,
            "wire dropped: name 'A' refers to a dropped element");
}

TEST_F(DeferredResolverTest, ResolveAll_ComponentAnchors) {
  models::Component component;
  component.type = "R";
  component.terminals = {{Absolute(0, 0), std::nullopt},
                         {Absolute(2, 4), std::nullopt}};
  models::Element element;
  element.body = std::move(component);
  element.visible_scopes = {0};
  Add(std::move(element), "R1");
  Add(NodeAt(Named("R1"), 1));
  Add(NodeAt(Named("R1", "start"), 2));
  Add(NodeAt(Named("R1", "+"), 3));

  ResolveAll();

  EXPECT_EQ(Resolved(document_.elements[1]), (Point{1, 2}));
  EXPECT_EQ(Resolved(document_.elements[2]), (Point{0, 0}));
  EXPECT_EQ(Resolved(document_.elements[3]), (Point{2, 4}));
}

TEST_F(DeferredResolverTest, ResolveAll_PathPointName_ResolvesToThatPoint) {
  auto wire = Add(WireThrough({Absolute(0, 0), Absolute(4, 0), Named("mid")}, 0));
  names_.Declare(0, "mid", {wire, 1, 0});

  EXPECT_EQ(ResolveAll(), 0u);
  EXPECT_EQ(Resolved(document_.elements[0], 2), (Point{4, 0}));
}

TEST_F(DeferredResolverTest, ResolveAll_GroupName_DoesNotDenotePoint) {
  models::Element group;
  group.body = models::Group{"g", {}, 1, true};
  Add(std::move(group), "g");
  Add(NodeAt(Named("g"), 1));

  EXPECT_EQ(ResolveAll(), 1u);
  ASSERT_EQ(document_.diagnostics.size(), 1u);
  EXPECT_EQ(document_.diagnostics[0].message,
            "node dropped: name 'g' does not denote a point");
}

TEST_F(DeferredResolverTest, ResolveAll_HiddenScope_IsNotVisible) {
  names_.Declare(1, "inner", {0, std::nullopt, 0});
  Add(NodeAt(Absolute(0, 0), 0));
  Add(NodeAt(Named("inner"), 1));

  EXPECT_EQ(ResolveAll(), 1u);
  ASSERT_EQ(document_.elements.size(), 1u);
}

TEST_F(DeferredResolverTest, ResolveAll_GroupIndicesAreRemapped) {
  models::Element group;
  group.body = models::Group{"g", {}, 1, true};
  Add(NodeAt(Named("missing"), 0));
  Add(std::move(group));
  auto child = NodeAt(Absolute(1, 1), 2);
  child.group = 1;
  Add(std::move(child));

  ResolveAll();

  ASSERT_EQ(document_.elements.size(), 2u);
  EXPECT_EQ(document_.elements[1].group, 0u);
}

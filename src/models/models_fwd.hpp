#pragma once

namespace models {

struct Token;
struct Point;
struct Coordinate;
struct OptionValue;
class OptionSet;
struct Label;
struct PathPoint;
struct Node;
struct Wire;
struct Component;
struct Group;
struct Element;

} // namespace models

#include "names.hpp"

#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace lexer {

namespace {
const std::unordered_map<std::string_view, Command> kCommands{
    {"\\draw", Command::kDraw},
    {"\\path", Command::kPath},
    {"\\node", Command::kNode},
    {"\\coordinate", Command::kCoordinate},
    {"\\begin{scope}", Command::kBeginScope},
    {"\\end{scope}", Command::kEndScope},
};

const std::unordered_set<std::string_view> kComponents{
    // resistive
    "R", "resistor", "american resistor", "european resistor", "generic",
    "vR", "variable resistor", "american variable resistor",
    "european variable resistor", "pR", "potentiometer",
    "american potentiometer", "european potentiometer", "thermistor",
    "thermistor ptc", "thermistor ntc", "photoresistor", "varistor",
    "memristor", "Z", "generic impedance", "ammeter", "voltmeter",
    "ohmmeter", "rmeter", "rmeterwa", "lamp", "bulb", "fuse", "afuse",
    // capacitive and inductive
    "C", "capacitor", "cC", "curved capacitor", "eC", "polar capacitor",
    "ecapacitor", "vC", "variable capacitor", "piezoelectric", "crystal",
    "xtal", "L", "inductor", "american inductor", "cute inductor",
    "european inductor", "vL", "variable inductor", "sL", "choke",
    // diodes
    "D", "diode", "empty diode", "full diode", "D*", "led", "leD",
    "photodiode", "pD", "zD", "zener diode", "sD", "schottky diode",
    "tD", "tunnel diode", "VC", "varcap",
    // sources
    "V", "vsource", "voltage source", "american voltage source",
    "european voltage source", "cute european voltage source", "sV",
    "sinusoidal voltage source", "vsourcesin", "dcvsource", "vsquare",
    "vsourcesquare", "vsourcetri", "battery", "battery1", "battery2",
    "I", "isource", "current source", "american current source",
    "european current source", "sI", "isourcesin", "dcisource", "cV",
    "controlled voltage source", "american controlled voltage source",
    "european controlled voltage source", "cI", "controlled current source",
    "american controlled current source", "european controlled current source",
    "cvsource", "cisource", "csV", "csI",
    // switches and wiring
    "switch", "spst", "nos", "ncs", "closing switch", "opening switch",
    "push button", "normal open switch", "normal closed switch", "toggle switch",
    "short", "open", "loudspeaker", "mic", "microphone", "antenna",
    "thermocouple", "solar cell", "bidirectionaldiode", "thyristor", "triac",
};
} // namespace

std::optional<Command> ParseCommand(std::string_view lexeme) {
  auto it = kCommands.find(lexeme);
  if (it == kCommands.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool IsPathWord(std::string_view word) { return word == kToOperator; }

bool IsKnownComponent(std::string_view key) {
  return kComponents.count(key) > 0;
}

} // namespace lexer

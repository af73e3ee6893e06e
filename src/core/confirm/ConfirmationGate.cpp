#include "ConfirmationGate.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <memory>
#include <ostream>
#include <utility>

namespace vts {

namespace {

std::string normalize(const std::string& raw) {
  auto first = std::find_if_not(raw.begin(), raw.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(raw.rbegin(), raw.rend(),
                               [](unsigned char c) { return std::isspace(c); }).base();
  std::string s = first < last ? std::string(first, last) : std::string();
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

} // namespace

const char* to_string(EntityKind kind) {
  switch (kind) {
    case EntityKind::StoreFile: return "Store file";
    case EntityKind::Table:     return "Table";
  }
  return "Entity";
}

ConfirmFn terminalPrompt(std::istream& in, std::ostream& out) {
  return [&in, &out](const std::string& entity, EntityKind kind) {
    bool minimal = false;
    for (;;) {
      if (minimal) {
        out << " Overwrite? (y,n) : " << std::flush;
      } else {
        out << " ****WARNING**** " << to_string(kind) << ": '" << entity << "' exists.\n"
            << " If you continue it *WILL* be overwritten\n"
            << " Overwrite? (y,n) : " << std::flush;
      }

      std::string line;
      if (!std::getline(in, line)) {
        out << "\n";
        return false;
      }
      const std::string option = normalize(line);
      if (option == "Y" || option == "N") {
        out << std::string(64, '*') << "\n";
        return option == "Y";
      }
      out << "ERROR: unrecognised choice '" << option << "'\n";
      minimal = true;
    }
  };
}

ConfirmFn alwaysAllow() {
  return [](const std::string&, EntityKind) { return true; };
}

ConfirmFn alwaysDeny() {
  return [](const std::string&, EntityKind) { return false; };
}

ConfirmFn scripted(std::deque<bool> answers) {
  auto queue = std::make_shared<std::deque<bool>>(std::move(answers));
  return [queue](const std::string&, EntityKind) {
    if (queue->empty()) return false;
    bool answer = queue->front();
    queue->pop_front();
    return answer;
  };
}

} // namespace vts

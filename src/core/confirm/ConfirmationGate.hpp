#pragma once
#include <deque>
#include <functional>
#include <iosfwd>
#include <string>

namespace vts {

enum class EntityKind { StoreFile, Table };

const char* to_string(EntityKind kind);

// Asked before an existing entity is overwritten or dropped.
// Returning false must leave everything untouched.
using ConfirmFn = std::function<bool(const std::string& entity, EntityKind kind)>;

// Interactive y/n prompt. Re-asks on unrecognised input; end of input declines.
ConfirmFn terminalPrompt(std::istream& in, std::ostream& out);

ConfirmFn alwaysAllow();
ConfirmFn alwaysDeny();

// Replays the given answers in order, then declines.
ConfirmFn scripted(std::deque<bool> answers);

} // namespace vts

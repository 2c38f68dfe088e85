#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "error.hpp"
#include "pos.hpp"
#include "value.hpp"

namespace linescript {

// Variables of one session. Entries are only ever added or overwritten.
struct VarStore {
    using Env = std::unordered_map<std::string, Value>;

    // Returns an error positioned at pos if the variable was never assigned.
    std::optional<Error> get(const std::string& name, const Pos& pos, Value& value) const;

    void set(const std::string& name, Value value);

    // nullptr if name is not defined
    const Value* find(const std::string& name) const;

    std::size_t size() const;

private:
    Env m_env;
};

}  // namespace linescript

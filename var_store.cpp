#include "var_store.hpp"

namespace linescript {

std::optional<Error> VarStore::get(const std::string& name, const Pos& pos, Value& value) const {
    auto* found = find(name);

    if (!found) {
        return Error{ErrorKind::EVAL, pos, "Undefined variable '" + name + "'"};
    }

    value = *found;

    return std::nullopt;
}

void VarStore::set(const std::string& name, Value value) { m_env[name] = std::move(value); }

const Value* VarStore::find(const std::string& name) const {
    auto found = m_env.find(name);

    if (found == m_env.end()) {
        return nullptr;
    }

    return &found->second;
}

std::size_t VarStore::size() const { return m_env.size(); }

}  // namespace linescript

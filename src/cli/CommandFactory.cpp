#include "cli/CommandFactory.hpp"

#include <algorithm>

namespace gitcl {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

void CommandFactory::registerAlias(const std::string& alias, const std::string& name) {
    aliases[alias] = name;
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto alias = aliases.find(name);
    auto it = creators.find(alias == aliases.end() ? name : alias->second);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}

#include "menu/Command.hpp"

Params Params::fromJson(const nlohmann::json& j) {
    if (j.is_null()) return none();
    if (j.is_array()) {
        std::vector<ArgValue> values(j.begin(), j.end());
        return sequence(std::move(values));
    }
    return single(j);
}

nlohmann::json Params::toJson() const {
    switch (kind_) {
        case Kind::None:     return nullptr;
        case Kind::Single:   return values_.front();
        case Kind::Sequence: return nlohmann::json(values_);
    }
    return nullptr;
}

Command::Command(Generic fn, std::string name)
    : name_(std::move(name))
{
    if (!fn) return;
    call_ = [fn = std::move(fn)](const Params& params) {
        fn(params.values());
    };
}

void Command::invoke(const Params& params) const {
    if (!call_)
        throw CommandError(describe(name_) + ": no function bound");
    call_(params);
}

std::vector<ArgValue> Command::resolveArguments(const Params& params,
                                                size_t arity,
                                                const std::string& name)
{
    auto mismatch = [&](const std::string& what) {
        return CommandError(describe(name) + " takes " +
                            std::to_string(arity) + " argument(s), " + what);
    };

    switch (params.kind()) {
        case Params::Kind::None:
            if (arity == 0) return {};
            throw mismatch("got none");

        case Params::Kind::Single:
            if (arity == 0) return {};
            if (arity == 1) return params.values();
            throw mismatch("got a single value");

        case Params::Kind::Sequence:
            if (arity == 1)
                return {nlohmann::json(params.values())};
            if (params.size() == arity) return params.values();
            throw mismatch("got " + std::to_string(params.size()));
    }
    return {};
}

std::string Command::describe(const std::string& name) {
    return name.empty() ? std::string("command") : "command '" + name + "'";
}

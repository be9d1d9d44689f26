#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// Argument values are dynamic: numbers, strings, bools, arrays, objects.
using ArgValue = nlohmann::json;

// Raised when a payload cannot be mapped onto a command's parameters
class CommandError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Argument payload bound to a menu element. Exactly one of:
// no arguments, a single value, or an ordered sequence of values.
class Params {
public:
    enum class Kind { None, Single, Sequence };

    Params() = default;

    static Params none() { return {}; }

    static Params single(ArgValue value) {
        Params p;
        p.kind_ = Kind::Single;
        p.values_.push_back(std::move(value));
        return p;
    }

    static Params sequence(std::vector<ArgValue> values) {
        Params p;
        p.kind_ = Kind::Sequence;
        p.values_ = std::move(values);
        return p;
    }

    // Params::of(2, 3) == Params::sequence({2, 3})
    template <typename... Ts>
    static Params of(Ts&&... values) {
        return sequence({ArgValue(std::forward<Ts>(values))...});
    }

    // null -> none, array -> sequence, anything else -> single
    static Params fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    Kind kind() const { return kind_; }
    bool empty() const { return kind_ == Kind::None; }
    size_t size() const { return values_.size(); }

    // The values as positional arguments, in order
    const std::vector<ArgValue>& values() const { return values_; }

private:
    Kind kind_ = Kind::None;
    std::vector<ArgValue> values_;
};

namespace detail {

template <typename T>
struct CallableTraits : CallableTraits<decltype(&T::operator())> {};

template <typename R, typename... A>
struct CallableTraits<R(A...)> {
    using Args = std::tuple<std::decay_t<A>...>;
    static constexpr size_t arity = sizeof...(A);
};

template <typename R, typename... A>
struct CallableTraits<R(*)(A...)> : CallableTraits<R(A...)> {};

template <typename C, typename R, typename... A>
struct CallableTraits<R(C::*)(A...)> : CallableTraits<R(A...)> {};

template <typename C, typename R, typename... A>
struct CallableTraits<R(C::*)(A...) const> : CallableTraits<R(A...)> {};

template <typename Tuple, size_t... I>
Tuple convertArguments(const std::vector<ArgValue>& args,
                       std::index_sequence<I...>) {
    return Tuple{args[I].template get<std::tuple_element_t<I, Tuple>>()...};
}

} // namespace detail

// A callable bound to a menu element. Either the generic form, which
// receives the payload as a vector of positional values, or a typed
// fixed-arity function wrapped with Command::of().
class Command {
public:
    using Generic = std::function<void(const std::vector<ArgValue>&)>;

    Command() = default;

    // Generic form: the payload's values are passed through as-is
    Command(Generic fn, std::string name = {});

    // Typed form. The payload is resolved against the function's arity:
    //   0 params: no payload or a single value (ignored)
    //   1 param:  a single value, or a whole sequence as one array value
    //   N params: a sequence of exactly N values
    // Values are converted to the parameter types at dispatch time.
    template <typename F>
    static Command of(F&& fn, std::string name = {}) {
        using Fn     = std::decay_t<F>;
        using Traits = detail::CallableTraits<Fn>;
        using Tuple  = typename Traits::Args;
        constexpr size_t arity = Traits::arity;

        Command cmd;
        cmd.name_ = std::move(name);
        cmd.call_ = [fn = Fn(std::forward<F>(fn)), label = cmd.name_]
                    (const Params& params) mutable {
            auto args = resolveArguments(params, arity, label);
            auto typed = [&]() -> Tuple {
                try {
                    return detail::convertArguments<Tuple>(
                        args, std::make_index_sequence<arity>{});
                } catch (const nlohmann::json::exception& e) {
                    throw CommandError(describe(label) +
                                       ": argument type mismatch: " + e.what());
                }
            }();
            std::apply(fn, std::move(typed));
        };
        return cmd;
    }

    explicit operator bool() const { return static_cast<bool>(call_); }

    // Calls the bound function exactly once. Exceptions from the
    // function itself propagate unchanged.
    void invoke(const Params& params) const;

    const std::string& name() const { return name_; }

    // Maps a payload onto `arity` positional values, or throws CommandError
    static std::vector<ArgValue> resolveArguments(const Params& params,
                                                  size_t arity,
                                                  const std::string& name);

private:
    static std::string describe(const std::string& name);

    std::function<void(const Params&)> call_;
    std::string name_;
};

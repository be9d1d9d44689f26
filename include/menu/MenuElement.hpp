#pragma once
#include "Command.hpp"
#include "Style.hpp"
#include <string>
#include <utility>

// One selectable line on a page: a label, its style and an optional
// bound command with its argument payload.
class MenuElement {
public:
    explicit MenuElement(std::string label,
                         Style style = Style::Regular,
                         Command command = {},
                         Params params = {})
        : label_(std::move(label)),
          style_(style),
          command_(std::move(command)),
          params_(std::move(params)) {}

    const std::string& label() const { return label_; }
    void setLabel(std::string label) { label_ = std::move(label); }

    Style style() const { return style_; }
    void setStyle(Style style) { style_ = style; }

    bool hasCommand() const { return static_cast<bool>(command_); }
    const Command& command() const { return command_; }
    const Params& params() const { return params_; }

    void bind(Command command, Params params = {}) {
        command_ = std::move(command);
        params_  = std::move(params);
    }

    void unbind() {
        command_ = {};
        params_  = {};
    }

    // Runs the bound command with the payload. Does nothing when unbound.
    void invoke() const {
        if (command_) command_.invoke(params_);
    }

private:
    std::string label_;
    Style       style_;
    Command     command_;
    Params      params_;
};

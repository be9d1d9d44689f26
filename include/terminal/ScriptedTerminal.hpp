#pragma once
#include "ITerminal.hpp"
#include <deque>
#include <string>
#include <vector>

// In-memory terminal. Input is queued up front; output is captured.
// Throws TerminalClosed once the queued input runs out.
class ScriptedTerminal : public ITerminal {
public:
    explicit ScriptedTerminal(int columns = 80)
        : columns_(columns) {}

    // Queue a single key event ("d", kKeyLeft, ...)
    ScriptedTerminal& pressKey(const std::string& key) {
        input_.push_back(key);
        return *this;
    }

    // Queue a typed line: its first character is a key event, the rest
    // is returned by the following readLine(). An empty line is Enter.
    ScriptedTerminal& typeLine(const std::string& line) {
        if (line.empty()) {
            input_.push_back(kKeyEnter);
            return *this;
        }
        input_.push_back(line.substr(0, 1));
        input_.push_back(line.substr(1));
        return *this;
    }

    // Queue a plain line for a readLine() that is not preceded by a key
    ScriptedTerminal& queueLine(const std::string& line) {
        input_.push_back(line);
        return *this;
    }

    void write(const std::string& text) override {
        output_ += text;
        screen_ += text;
    }

    std::string readKey() override { return pop(); }
    std::string readLine() override { return pop(); }

    void clearScreen() override {
        clears_++;
        screen_.clear();
    }

    int columns() const override { return columns_; }
    std::string backendName() const override { return "scripted"; }

    // Everything written so far
    const std::string& output() const { return output_; }

    // Everything written since the last clearScreen()
    const std::string& screen() const { return screen_; }

    int clearCount() const { return clears_; }
    size_t pendingInput() const { return input_.size(); }

private:
    std::string pop() {
        if (input_.empty())
            throw TerminalClosed("script exhausted");
        std::string s = input_.front();
        input_.pop_front();
        return s;
    }

    int columns_;
    std::deque<std::string> input_;
    std::string output_;
    std::string screen_;
    int clears_ = 0;
};

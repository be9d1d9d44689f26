#pragma once
#include <stdexcept>
#include <string>

// Raised by a terminal when no further input will arrive (end of file,
// interrupted read, exhausted script).
class TerminalClosed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Abstract terminal boundary used by the menu loop.
// Implementations: PosixTerminal (raw keystrokes on a tty),
// ScriptedTerminal (in-memory, for tests and piped runs).
class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Key tokens returned by readKey() for special keys
    static constexpr const char* kKeyLeft      = "\x1b[D";
    static constexpr const char* kKeyRight     = "\x1b[C";
    static constexpr const char* kKeyUp        = "\x1b[A";
    static constexpr const char* kKeyDown      = "\x1b[B";
    static constexpr const char* kKeyEnter     = "\r";
    static constexpr const char* kKeyBackspace = "\x7f";

    // Appends text to the output stream
    virtual void write(const std::string& text) = 0;

    // Blocks until one key event is available. Escape sequences are
    // returned whole. Throws TerminalClosed at end of input.
    virtual std::string readKey() = 0;

    // Reads the rest of the current line, without the newline.
    // Throws TerminalClosed at end of input.
    virtual std::string readLine() = 0;

    virtual void clearScreen() = 0;

    // Width in character cells
    virtual int columns() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};

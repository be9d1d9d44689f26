#pragma once
#include "ITerminal.hpp"
#include <termios.h>

// Terminal on stdin/stdout. Each readKey() switches the tty to
// non-canonical, no-echo mode for the duration of the read only, so
// readLine() and command output behave like a normal cooked terminal.
class PosixTerminal : public ITerminal {
public:
    PosixTerminal();
    ~PosixTerminal() override;

    void write(const std::string& text) override;
    std::string readKey() override;
    std::string readLine() override;
    void clearScreen() override;
    int columns() const override;
    std::string backendName() const override { return "posix"; }

    bool isTty() const { return tty_; }

private:
    // Restores the saved termios settings on scope exit
    class RawModeGuard {
    public:
        explicit RawModeGuard(bool enable);
        ~RawModeGuard();
        RawModeGuard(const RawModeGuard&) = delete;
        RawModeGuard& operator=(const RawModeGuard&) = delete;
    private:
        termios old_{};
        bool    active_ = false;
    };

    // One byte from stdin; false at end of input
    bool readByte(char& out);

    // Reads the tail of an escape sequence if one follows within a few ms
    std::string readEscapeTail();

    bool tty_ = false;
};

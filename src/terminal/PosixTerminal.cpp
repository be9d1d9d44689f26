#include "terminal/PosixTerminal.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

constexpr int kEscapeTimeoutMs = 30;

} // namespace

PosixTerminal::RawModeGuard::RawModeGuard(bool enable) {
    if (!enable) return;
    if (tcgetattr(STDIN_FILENO, &old_) != 0) return;

    termios raw = old_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0)
        active_ = true;
}

PosixTerminal::RawModeGuard::~RawModeGuard() {
    if (active_)
        tcsetattr(STDIN_FILENO, TCSANOW, &old_);
}

PosixTerminal::PosixTerminal()
    : tty_(::isatty(STDIN_FILENO) == 1)
{
    spdlog::debug("Terminal: stdin is {}", tty_ ? "a tty" : "not a tty");
}

PosixTerminal::~PosixTerminal() = default;

void PosixTerminal::write(const std::string& text) {
    const char* p = text.data();
    size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(STDOUT_FILENO, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("Terminal write failed: {}", std::strerror(errno));
            return;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

bool PosixTerminal::readByte(char& out) {
    ssize_t n = ::read(STDIN_FILENO, &out, 1);
    if (n == 1) return true;
    if (n == 0) return false;
    if (errno == EINTR)
        throw TerminalClosed("read interrupted");
    throw TerminalClosed(std::string("read failed: ") + std::strerror(errno));
}

std::string PosixTerminal::readEscapeTail() {
    std::string tail;
    pollfd pfd{STDIN_FILENO, POLLIN, 0};

    // ESC [ <params> <final byte 0x40..0x7e>
    while (tail.size() < 8) {
        if (::poll(&pfd, 1, kEscapeTimeoutMs) <= 0) break;
        char c;
        if (!readByte(c)) break;
        tail += c;
        if (tail.size() == 1 && c != '[' && c != 'O') break;
        if (tail.size() > 1 && c >= 0x40 && c <= 0x7e) break;
    }
    return tail;
}

std::string PosixTerminal::readKey() {
    RawModeGuard raw(tty_);

    char c;
    if (!readByte(c))
        throw TerminalClosed("end of input");

    std::string key(1, c);
    if (c == '\x1b' && tty_)
        key += readEscapeTail();
    if (key == "\n") key = kKeyEnter;
    return key;
}

std::string PosixTerminal::readLine() {
    std::string line;
    char c;
    while (true) {
        if (!readByte(c)) {
            if (line.empty())
                throw TerminalClosed("end of input");
            break;
        }
        if (c == '\n') break;
        if (c != '\r') line += c;
    }
    return line;
}

void PosixTerminal::clearScreen() {
    write("\x1b[2J\x1b[H");
}

int PosixTerminal::columns() const {
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    const char* env = std::getenv("COLUMNS");
    if (env) {
        int c = std::atoi(env);
        if (c > 0) return std::max(20, c);
    }
    return 80;
}

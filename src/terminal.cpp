#include "tmi/terminal.hpp"
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

namespace tmi {

namespace {

// Non-canonical, no-echo stdin for the lifetime of the object. ISIG stays
// off as well so Ctrl+C arrives as a byte the caller can act on.
class RawTerminalMode {
public:
  RawTerminalMode() {
    if (::isatty(STDIN_FILENO) != 1) return;
    if (tcgetattr(STDIN_FILENO, &original_) != 0) return;
    termios raw = original_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0) {
      active_ = true;
    }
  }

  ~RawTerminalMode() {
    if (active_) {
      tcsetattr(STDIN_FILENO, TCSANOW, &original_);
    }
  }

  RawTerminalMode(const RawTerminalMode&) = delete;
  RawTerminalMode& operator=(const RawTerminalMode&) = delete;

private:
  termios original_{};
  bool active_ = false;
};

}  // namespace

char ReadKeypress() {
  RawTerminalMode mode;
  char c = 0;
  ssize_t n = ::read(STDIN_FILENO, &c, 1);
  if (n != 1) {
    throw std::runtime_error("End of input while waiting for a keypress");
  }
  return c;
}

}  // namespace tmi

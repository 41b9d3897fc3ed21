#pragma once

namespace tmi {

// Block until one key is pressed and return it without echo. Reads a plain
// byte when stdin is not a terminal. Throws std::runtime_error on end of input.
char ReadKeypress();

}  // namespace tmi

#pragma once

#include <string>

// Renders text as a QR code using half-block characters, two modules per
// character row, with a one-module quiet border. Dark modules are drawn as
// blanks so the code reads correctly on dark terminals. Throws
// std::runtime_error if libqrencode cannot encode the text.
std::string render_terminal_qr(const std::string& text);

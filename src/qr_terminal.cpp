#include "qr_terminal.hpp"

#include <qrencode.h>

#include <memory>
#include <stdexcept>

namespace {

constexpr int kBorder = 1;

struct QrDeleter {
  void operator()(QRcode* qr) const { QRcode_free(qr); }
};

} // namespace

std::string render_terminal_qr(const std::string& text){
  std::unique_ptr<QRcode, QrDeleter> qr(
    QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_M, QR_MODE_8, 1));
  if(!qr) throw std::runtime_error("QRcode_encodeString failed");

  const int w = qr->width;
  auto lit = [&](int x, int y){
    if(x < 0 || y < 0 || x >= w || y >= w) return true; // quiet zone
    return (qr->data[y * w + x] & 1) == 0;
  };

  std::string out;
  for(int y = -kBorder; y < w + kBorder; y += 2){
    for(int x = -kBorder; x < w + kBorder; ++x){
      bool top = lit(x, y);
      bool bottom = (y + 1 < w + kBorder) ? lit(x, y + 1) : false;
      if(top && bottom) out += "█";
      else if(top) out += "▀";
      else if(bottom) out += "▄";
      else out += ' ';
    }
    out += '\n';
  }
  return out;
}

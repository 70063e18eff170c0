#include "ui/Surface.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <algorithm>
#include <ostream>

namespace psistat::ui {

std::string fit_text(const std::string& text, int col, int width, int surface_cols, Align align) {
  if (col < 0 || col >= surface_cols) return std::string();
  int avail = surface_cols - col;
  int w = (width < 0) ? avail : std::min(width, avail);
  if (w <= 0) return std::string();
  return align == Align::Right ? rpad_trunc(text, w) : clip_pad(text, w);
}

BufferSurface::BufferSurface(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)), lines_((size_t)rows_) {}

void BufferSurface::begin_frame() {
  lines_.assign((size_t)rows_, std::string());
}

void BufferSurface::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  lines_.resize((size_t)rows_);
}

void BufferSurface::put(int row, int col, const std::string& text, int width, Highlight, Align align) {
  if (row < 0 || row >= rows_) return;
  auto fitted = fit_text(text, col, width, cols_, align);
  if (fitted.empty()) return;
  auto& ln = lines_[(size_t)row];
  // Keep what lies left of 'col', overwrite from there
  std::string left = clip_pad(take_cols(ln, col), col);
  int tail_from = col + display_cols(fitted);
  std::string right;
  if (display_cols(ln) > tail_from) {
    std::string head = take_cols(ln, tail_from);
    right = ln.substr(head.size());
  }
  ln = left + fitted + right;
}

std::string BufferSurface::line(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  return lines_[(size_t)row];
}

StreamSurface::StreamSurface(std::ostream& out, int cols) : BufferSurface(0, cols), out_(out) {}

void StreamSurface::begin_frame() {
  // Grows on demand; no vertical limit for a scrolling stream
  resize(1000, cols_);
  BufferSurface::begin_frame();
}

void StreamSurface::end_frame() {
  size_t last = lines_.size();
  while (last > 0 && lines_[last - 1].empty()) --last;
  for (size_t i = 0; i < last; ++i) {
    auto ln = lines_[i];
    while (!ln.empty() && ln.back() == ' ') ln.pop_back();
    out_ << ln << '\n';
  }
  out_ << '\n';
  out_.flush();
}

TerminalSurface::TerminalSurface(bool alt_screen) : session_(alt_screen) {}

void TerminalSurface::begin_frame() {
  auto ts = term_size();
  rows_ = ts.rows;
  cols_ = ts.cols;
  touched_.assign((size_t)std::max(0, rows_), false);
  frame_.clear();
  frame_.reserve((size_t)rows_ * (size_t)cols_ + 64);
}

void TerminalSurface::put(int row, int col, const std::string& text, int width, Highlight hl, Align align) {
  if (session_.suspended() || row < 0 || row >= rows_) return;
  auto fitted = fit_text(text, col, width, cols_, align);
  if (fitted.empty()) return;
  const auto& ui = ui_config();
  std::string color;
  switch (hl) {
    case Highlight::Header: color = attr_bold() + ui.accent; break;
    case Highlight::Warn: color = ui.warning; break;
    case Highlight::Muted: color = ui.muted; break;
    case Highlight::None: break;
  }
  frame_ += "\x1B[" + std::to_string(row + 1) + ";" + std::to_string(col + 1) + "H";
  if (!color.empty()) frame_ += color + fitted + attr_reset();
  else frame_ += fitted;
  touched_[(size_t)row] = true;
}

void TerminalSurface::end_frame() {
  if (session_.suspended()) return;
  for (int r = 0; r < rows_; ++r) {
    if (!touched_[(size_t)r]) frame_ += "\x1B[" + std::to_string(r + 1) + ";1H\x1B[2K";
  }
  // Park the cursor on the last cell so teardown never interleaves with the frame
  frame_ += "\x1B[" + std::to_string(std::max(1, rows_)) + ";" + std::to_string(std::max(1, cols_)) + "H";
  if (::write(STDOUT_FILENO, frame_.data(), frame_.size()) < 0) {
    // A lost frame is replaced on the next tick
  }
  frame_.clear();
}

void TerminalSurface::suspend() {
  session_.suspend();
}

void TerminalSurface::resume() {
  session_.resume();
}

} // namespace psistat::ui

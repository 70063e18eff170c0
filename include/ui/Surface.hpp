#pragma once

#include "ui/Terminal.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace psistat::ui {

enum class Highlight { None, Header, Warn, Muted };
enum class Align { Left, Right };

// Row/column text target. Anything outside the current bounds is dropped;
// text is clipped at the right edge and padded to the requested width.
class ITextSurface {
public:
  virtual ~ITextSurface() = default;

  // Start a frame; re-reads the surface dimensions.
  virtual void begin_frame() = 0;
  virtual void end_frame() = 0;

  [[nodiscard]] virtual int rows() const = 0;
  [[nodiscard]] virtual int cols() const = 0;

  // width < 0 means "to the right edge"
  virtual void put(int row, int col, const std::string& text, int width = -1,
                   Highlight hl = Highlight::None, Align align = Align::Left) = 0;

  // Give the screen back for plain output (history dump) and take it again.
  virtual void suspend() {}
  virtual void resume() {}
};

// Fixed-size in-memory grid of lines; highlight is ignored.
class BufferSurface : public ITextSurface {
public:
  BufferSurface(int rows, int cols);

  void begin_frame() override;
  void end_frame() override {}
  [[nodiscard]] int rows() const override { return rows_; }
  [[nodiscard]] int cols() const override { return cols_; }
  void put(int row, int col, const std::string& text, int width = -1,
           Highlight hl = Highlight::None, Align align = Align::Left) override;

  void resize(int rows, int cols);
  [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }
  [[nodiscard]] std::string line(int row) const;

protected:
  int rows_;
  int cols_;
  std::vector<std::string> lines_;
};

// Plain text lines to a stream, one block per frame (debug mode).
class StreamSurface : public BufferSurface {
public:
  StreamSurface(std::ostream& out, int cols);
  void begin_frame() override;
  void end_frame() override;

private:
  std::ostream& out_;
};

// ANSI terminal. Holds the TerminalSession for its whole life, so the
// terminal is back to normal once the surface is gone. Each frame is
// assembled off-screen and written in one go.
class TerminalSurface : public ITextSurface {
public:
  explicit TerminalSurface(bool alt_screen);

  void begin_frame() override;
  void end_frame() override;
  [[nodiscard]] int rows() const override { return rows_; }
  [[nodiscard]] int cols() const override { return cols_; }
  void put(int row, int col, const std::string& text, int width = -1,
           Highlight hl = Highlight::None, Align align = Align::Left) override;
  void suspend() override;
  void resume() override;

private:
  TerminalSession session_;
  int rows_{0};
  int cols_{0};
  std::string frame_;
  std::vector<bool> touched_;
};

// Shared clip/pad rule for all surfaces; empty when nothing is visible.
[[nodiscard]] std::string fit_text(const std::string& text, int col, int width, int surface_cols, Align align);

} // namespace psistat::ui

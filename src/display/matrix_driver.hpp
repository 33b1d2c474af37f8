#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "hardware.hpp"

// Strip index of matrix cell (x, y) for a wiring layout. (0, 0) is top-left.
int matrix_index(int x, int y, int width, int height, MatrixLayout layout);

// Scale each channel by brightness (0.0-1.0), rounding to nearest.
Rgb scale_color(Rgb color, double brightness);

// Full frame in strip order: the text drawn with the 5x7 font from its start
// column, one color per glyph, everything else off. Glyph columns past the
// right edge are clipped; rows below the matrix height are dropped.
std::vector<Rgb> render_frame(const std::optional<MatrixText>& text,
                              const MatrixConfig& config);

// Draws the matrix text. The strip is only touched when the text changes.
class MatrixDriver {
public:
    MatrixDriver(std::unique_ptr<PixelStrip> strip, const MatrixConfig& config);

    void apply(const std::optional<MatrixText>& text);

    // Blank the matrix whatever is showing.
    void shutdown();

private:
    std::unique_ptr<PixelStrip> strip_;
    MatrixConfig config_;
    bool rendered_ = false;
    std::optional<MatrixText> shown_;
};

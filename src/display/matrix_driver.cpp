#include "matrix_driver.hpp"
#include "font.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

int matrix_index(int x, int y, int width, int height, MatrixLayout layout) {
    switch (layout) {
        case MatrixLayout::Rows:
            return y * width + x;
        case MatrixLayout::Columns:
            return x * height + y;
        case MatrixLayout::SerpentineRows:
            return y * width + ((y % 2 == 0) ? x : width - 1 - x);
        case MatrixLayout::SerpentineColumns:
            return x * height + ((x % 2 == 0) ? y : height - 1 - y);
    }
    return y * width + x;
}

Rgb scale_color(Rgb color, double brightness) {
    auto scale = [brightness](uint8_t c) {
        long v = std::lround(c * brightness);
        return static_cast<uint8_t>(std::clamp(v, 0L, 255L));
    };
    return Rgb{scale(color.r), scale(color.g), scale(color.b)};
}

std::vector<Rgb> render_frame(const std::optional<MatrixText>& text,
                              const MatrixConfig& config) {
    const int w = config.width;
    const int h = config.height;
    std::vector<Rgb> frame(static_cast<size_t>(w * h), COLOR_OFF);
    if (!text) return frame;

    const int rows = std::min(h, GLYPH_HEIGHT);
    for (size_t i = 0; i < text->text.size(); ++i) {
        Rgb color = i < text->colors.size() ? text->colors[i]
                  : (text->colors.empty() ? COLOR_OFF : text->colors.back());
        color = scale_color(color, config.brightness);

        const Glyph& glyph = glyph_for(text->text[i]);
        int x0 = text->x_offset + static_cast<int>(i) * GLYPH_ADVANCE;
        for (int col = 0; col < GLYPH_WIDTH; ++col) {
            int x = x0 + col;
            if (x < 0 || x >= w) continue;
            for (int y = 0; y < rows; ++y) {
                if (glyph[static_cast<size_t>(col)] & (1u << y)) {
                    frame[static_cast<size_t>(matrix_index(x, y, w, h, config.layout))] = color;
                }
            }
        }
    }
    return frame;
}

MatrixDriver::MatrixDriver(std::unique_ptr<PixelStrip> strip, const MatrixConfig& config)
    : strip_(std::move(strip)), config_(config) {}

void MatrixDriver::apply(const std::optional<MatrixText>& text) {
    if (rendered_ && shown_ == text) return;

    auto frame = render_frame(text, config_);
    for (size_t i = 0; i < frame.size(); ++i) {
        strip_->set(static_cast<int>(i), frame[i]);
    }
    strip_->show();

    rendered_ = true;
    shown_ = text;
    log_info(text ? fmt::format("Matrix: \"{}\"", text->text) : std::string("Matrix: blank"));
}

void MatrixDriver::shutdown() {
    strip_->fill(COLOR_OFF);
    strip_->show();
    rendered_ = true;
    shown_.reset();
}

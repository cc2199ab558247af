#include "specvis/render_style.hpp"

#include "string_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace specvis {

const char* to_string(RenderStyle style) noexcept {
    switch (style) {
        case RenderStyle::Bars:
            return "bars";
        case RenderStyle::Dots:
            return "dots";
        case RenderStyle::Waveform:
            return "waveform";
        case RenderStyle::LedMeter:
            return "ledmeter";
        case RenderStyle::Particles:
            return "particles";
        case RenderStyle::Waterfall:
            return "waterfall";
        case RenderStyle::Gauge:
            return "gauge";
    }
    return "unknown";
}

RenderStyle parse_style(std::string_view text) {
    const auto token = detail::normalize_token(text);
    for (const auto style : kAllRenderStyles) {
        if (token == to_string(style)) {
            return style;
        }
    }
    throw std::invalid_argument("Unknown render style: " + std::string(text));
}

namespace {

std::size_t style_index(RenderStyle style) noexcept {
    const auto it = std::find(kAllRenderStyles.begin(), kAllRenderStyles.end(), style);
    return it == kAllRenderStyles.end()
               ? 0
               : static_cast<std::size_t>(it - kAllRenderStyles.begin());
}

}  // namespace

RenderStyle next_style(RenderStyle style) noexcept {
    return kAllRenderStyles[(style_index(style) + 1) % kAllRenderStyles.size()];
}

RenderStyle previous_style(RenderStyle style) noexcept {
    const auto n = kAllRenderStyles.size();
    return kAllRenderStyles[(style_index(style) + n - 1) % n];
}

}  // namespace specvis

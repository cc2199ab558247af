#include "specvis/render_quality.hpp"

#include "string_utils.hpp"

#include <stdexcept>
#include <string>

namespace specvis {

const char* to_string(RenderQuality quality) noexcept {
    switch (quality) {
        case RenderQuality::Low:
            return "low";
        case RenderQuality::Medium:
            return "medium";
        case RenderQuality::High:
            return "high";
    }
    return "medium";
}

RenderQuality parse_quality(std::string_view text) {
    const auto token = detail::normalize_token(text);
    if (token == "low") return RenderQuality::Low;
    if (token == "medium" || token == "med") return RenderQuality::Medium;
    if (token == "high") return RenderQuality::High;
    throw std::invalid_argument("Unknown render quality: " + std::string(text));
}

}  // namespace specvis

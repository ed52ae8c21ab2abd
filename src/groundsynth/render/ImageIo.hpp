#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace GS {

// Tightly packed RGBA8 pixels.
struct SoftwareImage {
    int                       width  = 0;
    int                       height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] auto valid() const -> bool {
        return width > 0 && height > 0
               && pixels.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    }
};

auto ReadImagePng(std::filesystem::path const& input_path) -> Expected<SoftwareImage>;

auto WriteImagePng(SoftwareImage const& image, std::filesystem::path const& output_path) -> Expected<void>;

} // namespace GS

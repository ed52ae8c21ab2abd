#include "render/ImageIo.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <system_error>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_STATIC
#include <stb_image.h>
#undef STB_IMAGE_IMPLEMENTATION
#undef STB_IMAGE_STATIC

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STB_IMAGE_WRITE_STATIC
#include <stb_image_write.h>
#undef STB_IMAGE_WRITE_IMPLEMENTATION
#undef STB_IMAGE_WRITE_STATIC

namespace GS {

namespace {

auto io_error(std::string message, std::filesystem::path const& path) -> Error {
    return makeError(Error::Code::IoError, std::move(message) + ": " + path.string());
}

} // namespace

auto ReadImagePng(std::filesystem::path const& input_path) -> Expected<SoftwareImage> {
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> file(std::fopen(input_path.string().c_str(), "rb"), &std::fclose);
    if (!file) {
        return std::unexpected(makeError(Error::Code::NotFound, "failed to open PNG: " + input_path.string()));
    }
    std::fseek(file.get(), 0, SEEK_END);
    auto size = std::ftell(file.get());
    std::fseek(file.get(), 0, SEEK_SET);
    if (size <= 0) {
        return std::unexpected(io_error("empty PNG", input_path));
    }
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (std::fread(buffer.data(), 1, buffer.size(), file.get()) != buffer.size()) {
        return std::unexpected(io_error("failed to read PNG", input_path));
    }

    int  width      = 0;
    int  height     = 0;
    int  components = 0;
    auto* data = stbi_load_from_memory(buffer.data(), static_cast<int>(buffer.size()), &width, &height, &components, 4);
    if (data == nullptr) {
        return std::unexpected(io_error("failed to decode PNG", input_path));
    }
    SoftwareImage image{};
    image.width  = width;
    image.height = height;
    auto total   = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    image.pixels.assign(data, data + total);
    stbi_image_free(data);
    return image;
}

auto WriteImagePng(SoftwareImage const& image, std::filesystem::path const& output_path) -> Expected<void> {
    if (image.width <= 0 || image.height <= 0) {
        return std::unexpected(makeError(Error::Code::InvalidArgument, "invalid image dimensions"));
    }
    auto parent = output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(io_error("failed to create output directory", parent));
        }
    }
    auto row_bytes = static_cast<std::size_t>(image.width) * 4u;
    if (image.pixels.size() != row_bytes * static_cast<std::size_t>(image.height)) {
        return std::unexpected(makeError(Error::Code::InvalidArgument, "pixel buffer length mismatch"));
    }
    if (stbi_write_png(output_path.string().c_str(),
                       image.width,
                       image.height,
                       4,
                       image.pixels.data(),
                       static_cast<int>(row_bytes))
        == 0) {
        return std::unexpected(io_error("failed to encode PNG", output_path));
    }
    return {};
}

} // namespace GS

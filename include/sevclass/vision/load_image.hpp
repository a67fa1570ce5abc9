#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sevclass::vision {

/// Read an image file's encoded bytes. Returns nullopt if the file cannot be read.
std::optional<std::vector<std::byte>> load_encoded_image(const std::string& path);

/// Upstream format check on the file name: ".jpg" or ".jpeg", case-insensitive.
/// The decoder still validates the bytes on its own.
bool has_jpeg_extension(const std::string& path);

}  // namespace sevclass::vision

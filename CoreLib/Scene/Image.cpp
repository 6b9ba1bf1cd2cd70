#include "Image.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <cstring>
#include <iostream>
#include <stdexcept>

Image::Image(int width, int height, int channels)
{
    allocate(width, height, channels);
}

bool Image::allocate(int width, int height, int channels)
{
    if (width <= 0 || height <= 0 || channels <= 0 || channels > 4)
    {
        m_width = m_height = m_channels = 0;
        m_pixels.clear();
        return false;
    }

    const size_t rowBytes = size_t(width) * size_t(channels);
    if (size_t(height) > m_pixels.max_size() / rowBytes)
        throw std::length_error("Image: " + std::to_string(width) + "x" + std::to_string(height) + " is too large");

    // Dimensions change only once the storage exists.
    std::vector<unsigned char> pixels(rowBytes * size_t(height), 0);

    m_pixels.swap(pixels);
    m_width    = width;
    m_height   = height;
    m_channels = channels;
    return true;
}

bool Image::loadFromEncodedMemory(const unsigned char* data,
                                  int                  sizeInBytes,
                                  bool                 flipY)
{
    if (!data || sizeInBytes <= 0)
        return false;

    stbi_set_flip_vertically_on_load(flipY);
    unsigned char* raw = stbi_load_from_memory(
        data,
        sizeInBytes,
        &m_width,
        &m_height,
        &m_channels,
        0);

    if (!raw)
    {
        std::cerr << "Failed to load image from memory: "
                  << stbi_failure_reason() << "\n";
        m_width = m_height = m_channels = 0;
        m_pixels.clear();
        return false;
    }

    m_pixels.assign(raw, raw + (size_t(m_width) * size_t(m_height) * size_t(m_channels)));
    stbi_image_free(raw);
    return true;
}

Image Image::clone() const
{
    Image out;
    out.m_name     = m_name;
    out.m_width    = m_width;
    out.m_height   = m_height;
    out.m_channels = m_channels;
    out.m_pixels   = m_pixels;
    return out;
}

glm::u8vec4 Image::pixel(int x, int y) const noexcept
{
    if (x < 0 || y < 0 || x >= m_width || y >= m_height)
        return glm::u8vec4(0);

    const unsigned char* p = m_pixels.data() + (size_t(y) * size_t(m_width) + size_t(x)) * size_t(m_channels);

    glm::u8vec4 c(0, 0, 0, 255);
    for (int i = 0; i < m_channels; ++i)
        c[i] = p[i];
    return c;
}

void Image::setPixel(int x, int y, const glm::u8vec4& rgba) noexcept
{
    if (x < 0 || y < 0 || x >= m_width || y >= m_height)
        return;

    unsigned char* p = m_pixels.data() + (size_t(y) * size_t(m_width) + size_t(x)) * size_t(m_channels);
    for (int i = 0; i < m_channels; ++i)
        p[i] = rgba[i];
}

void Image::fill(const glm::u8vec4& rgba) noexcept
{
    const size_t count = size_t(m_width) * size_t(m_height);
    for (size_t i = 0; i < count; ++i)
    {
        unsigned char* p = m_pixels.data() + i * size_t(m_channels);
        for (int c = 0; c < m_channels; ++c)
            p[c] = rgba[c];
    }
}

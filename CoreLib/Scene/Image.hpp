#pragma once
#include <glm/gtc/type_precision.hpp>
#include <string>
#include <vector>

/**
 * @brief 8-bit interleaved raster (RGBA for render targets).
 *
 * Rows are stored top to bottom. Copies are explicit through clone() so a
 * render target is never duplicated by accident.
 */
class Image
{
public:
    Image() = default;
    Image(int width, int height, int channels = 4);
    ~Image() = default;

    // No copies
    Image(const Image&)            = delete;
    Image& operator=(const Image&) = delete;

    // Moves are fine
    Image(Image&&) noexcept            = default;
    Image& operator=(Image&&) noexcept = default;

    /**
     * @brief Resizes and clears to zero (transparent black for RGBA).
     *
     * Returns false for non-positive sizes. Throws std::length_error when the
     * size overflows and std::bad_alloc when storage runs out; the image is
     * left unchanged in both cases.
     */
    bool allocate(int width, int height, int channels = 4);

    bool loadFromEncodedMemory(const unsigned char* data,
                               int                  sizeInBytes,
                               bool                 flipY = false);

    [[nodiscard]] Image clone() const;

    bool valid() const noexcept
    {
        return m_width > 0 && m_height > 0 && !m_pixels.empty();
    }

    int width() const
    {
        return m_width;
    }

    int height() const
    {
        return m_height;
    }

    int channels() const
    {
        return m_channels;
    }

    int stride() const noexcept
    {
        return m_width * m_channels;
    }

    const unsigned char* data() const
    {
        return m_pixels.data();
    }

    unsigned char* data() noexcept
    {
        return m_pixels.data();
    }

    /// RGBA at (x,y); missing channels read as 0 (alpha as 255). Out of range reads as 0.
    [[nodiscard]] glm::u8vec4 pixel(int x, int y) const noexcept;

    /// Writes the first channels() components; out of range writes are ignored.
    void setPixel(int x, int y, const glm::u8vec4& rgba) noexcept;

    void fill(const glm::u8vec4& rgba) noexcept;

    void setName(const std::string& name)
    {
        m_name = name;
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

private:
    std::string                m_name;
    int                        m_width = 0, m_height = 0, m_channels = 0;
    std::vector<unsigned char> m_pixels;
};

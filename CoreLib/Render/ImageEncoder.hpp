//============================================================
// ImageEncoder.hpp
//============================================================
#pragma once

#include <cstdint>
#include <future>
#include <vector>

class Image;

/// Encoded bytes of one snapshot.
struct EncodedImage
{
    uint64_t             requestId = 0;
    int32_t              width     = 0;
    int32_t              height    = 0;
    std::vector<uint8_t> bytes;

    [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
};

/**
 * @brief Asynchronous image encoder.
 *
 * encode() must not block on the encode itself. The future either holds
 * the result or an exception describing the failure. Dropping the future
 * must not block either (no std::async).
 */
class ImageEncoder
{
public:
    virtual ~ImageEncoder() = default;

    virtual std::future<EncodedImage> encode(Image image, uint64_t requestId) = 0;

protected:
    ImageEncoder() = default;
};

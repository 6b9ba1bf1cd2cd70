//============================================================
// PngEncoder.hpp
//============================================================
#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include "Image.hpp"
#include "ImageEncoder.hpp"

/**
 * @brief Lossless PNG encoder with a single background worker.
 *
 * Jobs run in submission order. Pending jobs are abandoned (broken promise)
 * when the encoder is destroyed.
 */
class PngEncoder final : public ImageEncoder
{
public:
    PngEncoder();
    ~PngEncoder() override;

    PngEncoder(const PngEncoder&)            = delete;
    PngEncoder& operator=(const PngEncoder&) = delete;

    std::future<EncodedImage> encode(Image image, uint64_t requestId) override;

    /// Synchronous encode; returns false on failure.
    static bool encodePng(const Image& image, std::vector<uint8_t>& out);

private:
    struct Job
    {
        Image                      image;
        uint64_t                   requestId = 0;
        std::promise<EncodedImage> promise;
    };

    void workerLoop();

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    std::deque<Job>         m_jobs;
    bool                    m_shutdown = false;
    std::thread             m_worker;
};

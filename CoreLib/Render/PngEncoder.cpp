//============================================================
// PngEncoder.cpp
//============================================================
#include "PngEncoder.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
    void appendBytes(void* context, void* data, int size)
    {
        auto*       out   = static_cast<std::vector<uint8_t>*>(context);
        const auto* bytes = static_cast<const uint8_t*>(data);
        out->insert(out->end(), bytes, bytes + size);
    }

} // namespace

PngEncoder::PngEncoder() : m_worker{&PngEncoder::workerLoop, this}
{
}

PngEncoder::~PngEncoder()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();

    if (m_worker.joinable())
        m_worker.join();
}

std::future<EncodedImage> PngEncoder::encode(Image image, uint64_t requestId)
{
    Job job;
    job.image     = std::move(image);
    job.requestId = requestId;

    std::future<EncodedImage> future = job.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.push_back(std::move(job));
    }
    m_cv.notify_one();

    return future;
}

bool PngEncoder::encodePng(const Image& image, std::vector<uint8_t>& out)
{
    out.clear();
    if (!image.valid())
        return false;

    const int ok = stbi_write_png_to_func(appendBytes,
                                          &out,
                                          image.width(),
                                          image.height(),
                                          image.channels(),
                                          image.data(),
                                          image.stride());
    return ok != 0 && !out.empty();
}

void PngEncoder::workerLoop()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_jobs.empty(); });

            if (m_shutdown)
                return; // remaining promises break on destruction

            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }

        EncodedImage result;
        result.requestId = job.requestId;
        result.width     = job.image.width();
        result.height    = job.image.height();

        if (encodePng(job.image, result.bytes))
        {
            job.promise.set_value(std::move(result));
        }
        else
        {
            std::cerr << "PngEncoder: encode failed for request " << job.requestId << "\n";
            job.promise.set_exception(std::make_exception_ptr(
                std::runtime_error("PngEncoder: stbi_write_png_to_func failed for request " + std::to_string(job.requestId))));
        }
    }
}

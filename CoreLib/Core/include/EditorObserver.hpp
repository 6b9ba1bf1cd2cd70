//=============================================================================
// EditorObserver.hpp
//=============================================================================
#pragma once

#include <filesystem>
#include <memory>

#include "ImageEncoder.hpp"
#include "LightRecord.hpp"

/**
 * @brief Receives editor notifications.
 *
 * All callbacks run on the thread that drives MatcapEditor (pointer
 * events and poll()). Default implementations ignore the event.
 */
class EditorObserver
{
public:
    virtual ~EditorObserver() = default;

    /// The editor finished construction and can take input.
    virtual void contentReady() {}

    virtual void lightAdded(const LightRecord& /*record*/) {}
    virtual void lightUpdated(const LightRecord& /*record*/) {}
    virtual void lightRemoved(LightId /*id*/) {}

    /// A new preview PNG is available. The image is immutable and may be kept.
    virtual void previewUpdated(std::shared_ptr<const EncodedImage> /*image*/) {}

    /// An export finished (ok) or failed/was abandoned (!ok).
    virtual void imageExported(const std::filesystem::path& /*path*/, bool /*ok*/) {}

protected:
    EditorObserver() = default;
};

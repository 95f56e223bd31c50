#pragma once

// PresentationSink.h
// Outbound events from the core to the presentation layer (modal renderer,
// navigation bar, cursor). The core never knows how they are rendered.

#include "ContentStore.h"
#include "QualitySettings.h"
#include <cstdint>
#include <string>

namespace Atrium::Game {

class PresentationSink {
public:
    virtual ~PresentationSink() = default;

    virtual void OnPanelContentRequested(const std::string& key, const ContentRecord& record) = 0;
    virtual void OnContentUnavailable(const std::string& key) = 0;
    virtual void OnExternalLinkRequested(const std::string& url) = 0;
    virtual void OnInformationalDialogueRequested(const std::string& body) = 0;

    // Optional notifications
    virtual void OnHologramFocused(int32_t panelIndex) { (void)panelIndex; }
    virtual void OnActiveSectionChanged(const std::string& section) { (void)section; }
    virtual void OnQualityChanged(const QualitySettings& settings) { (void)settings; }
    virtual void OnCursorChanged(bool interactive) { (void)interactive; }
};

} // namespace Atrium::Game

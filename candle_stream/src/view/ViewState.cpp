#include "ViewState.hpp"
#include <algorithm>

namespace candle {

    ViewState::ViewState(int windowSize, double zoomBufferFraction, double bodyWidth)
        : requestedWindow_(std::max(MIN_WINDOW, windowSize))
        , zoomBufferFraction_(std::clamp(zoomBufferFraction, MIN_ZOOM_BUFFER, MAX_ZOOM_BUFFER))
        , bodyWidth_(std::clamp(bodyWidth, MIN_BODY_WIDTH, MAX_BODY_WIDTH))
    {
    }

    size_t ViewState::getWindowSize(size_t count) const {
        if (count < static_cast<size_t>(MIN_WINDOW)) return count;
        return std::min(static_cast<size_t>(requestedWindow_), count);
    }

    size_t ViewState::maxStart(size_t count) const {
        return count - getWindowSize(count);
    }

    void ViewState::clampStart(size_t count) {
        startIndex_ = std::min(startIndex_, maxStart(count));
    }

    void ViewState::scroll(int64_t targetStart, size_t count) {
        int64_t upper = static_cast<int64_t>(maxStart(count));
        startIndex_ = static_cast<size_t>(std::clamp<int64_t>(targetStart, 0, upper));
    }

    void ViewState::resizeWindow(int newSize, size_t count) {
        bool live = isAtLiveEdge(count);
        requestedWindow_ = std::max(MIN_WINDOW, newSize);
        if (live) {
            startIndex_ = maxStart(count);
        }
        else {
            clampStart(count);
        }
    }

    void ViewState::narrowWindow(size_t count) {
        resizeWindow(requestedWindow_ - WINDOW_STEP, count);
    }

    void ViewState::widenWindow(size_t count) {
        resizeWindow(requestedWindow_ + WINDOW_STEP, count);
    }

    void ViewState::zoomIn() {
        setZoomBufferFraction(zoomBufferFraction_ * ZOOM_IN_FACTOR);
    }

    void ViewState::zoomOut() {
        setZoomBufferFraction(zoomBufferFraction_ * ZOOM_OUT_FACTOR);
    }

    void ViewState::setZoomBufferFraction(double fraction) {
        zoomBufferFraction_ = std::clamp(fraction, MIN_ZOOM_BUFFER, MAX_ZOOM_BUFFER);
    }

    void ViewState::squeezeIn() {
        bodyWidth_ = std::min(MAX_BODY_WIDTH, bodyWidth_ + BODY_WIDTH_STEP);
    }

    void ViewState::squeezeOut() {
        bodyWidth_ = std::max(MIN_BODY_WIDTH, bodyWidth_ - BODY_WIDTH_STEP);
    }

    void ViewState::setBodyWidth(double width) {
        bodyWidth_ = std::clamp(width, MIN_BODY_WIDTH, MAX_BODY_WIDTH);
    }

    void ViewState::followLive(size_t count) {
        startIndex_ = maxStart(count);
    }

    void ViewState::onAppend(size_t oldCount, size_t newCount) {
        if (isAtLiveEdge(oldCount)) {
            startIndex_ = maxStart(newCount);
        }
        else {
            clampStart(newCount);
        }
    }

    std::pair<size_t, size_t> ViewState::visibleRange(size_t count) const {
        size_t start = std::min(startIndex_, maxStart(count));
        return { start, start + getWindowSize(count) };
    }

} // namespace candle

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

namespace candle {

    // Visible window over the tail (or, after a scroll, the history) of the
    // candle log. Every mutator takes the current log length and re-clamps:
    //   window   = clamp(requested, MIN_WINDOW, N)   (N when N < MIN_WINDOW)
    //   start    in [0, max(0, N - window)]
    class ViewState {
    public:
        static constexpr int MIN_WINDOW = 5;
        static constexpr int WINDOW_STEP = 5;

        static constexpr double ZOOM_IN_FACTOR = 0.8;
        static constexpr double ZOOM_OUT_FACTOR = 1.2;
        static constexpr double MIN_ZOOM_BUFFER = 0.01;
        static constexpr double MAX_ZOOM_BUFFER = 0.5;

        static constexpr double MIN_BODY_WIDTH = 0.2;
        static constexpr double MAX_BODY_WIDTH = 1.0;
        static constexpr double BODY_WIDTH_STEP = 0.1;

        explicit ViewState(int windowSize = 30, double zoomBufferFraction = 0.05, double bodyWidth = 0.6);

        // start = clamp(target, 0, max(0, N - window))
        void scroll(int64_t targetStart, size_t count);

        // Sets the requested window (>= MIN_WINDOW) and re-clamps start
        void resizeWindow(int newSize, size_t count);

        // Visible-points zoom: shrink / grow the requested window by WINDOW_STEP
        void narrowWindow(size_t count);
        void widenWindow(size_t count);

        // Vertical zoom: scale the price buffer fraction, window untouched
        void zoomIn();
        void zoomOut();
        void setZoomBufferFraction(double fraction);

        // Candle body width hint for the renderer
        void squeezeIn();
        void squeezeOut();
        void setBodyWidth(double width);

        // Release a historical scroll and jump to the live edge
        void followLive(size_t count);

        // Tracks the live edge if the view sat on it before the append;
        // a view scrolled into history stays where it is.
        void onAppend(size_t oldCount, size_t newCount);

        size_t getWindowSize(size_t count) const;
        size_t getStartIndex() const { return startIndex_; }
        int getRequestedWindow() const { return requestedWindow_; }
        double getZoomBufferFraction() const { return zoomBufferFraction_; }
        double getBodyWidth() const { return bodyWidth_; }

        size_t maxStart(size_t count) const;
        bool isAtLiveEdge(size_t count) const { return startIndex_ >= maxStart(count); }

        // [start, end) of the visible slice
        std::pair<size_t, size_t> visibleRange(size_t count) const;

    private:
        int requestedWindow_;
        size_t startIndex_ = 0;
        double zoomBufferFraction_;
        double bodyWidth_;

        void clampStart(size_t count);
    };

} // namespace candle

#include "AtrBandsIndicator.hpp"
#include <numeric>

namespace candle {

    AtrBandsIndicator::AtrBandsIndicator(const IndicatorParams& params)
        : Indicator(IndicatorKind::ATR_BANDS, params)
    {
        output(UPPER);
        output(LOWER);
    }

    void AtrBandsIndicator::resetState() {
        closes_.clear();
        trueRanges_.clear();
    }

    double AtrBandsIndicator::mean(const std::deque<double>& window) {
        return std::accumulate(window.begin(), window.end(), 0.0) / window.size();
    }

    void AtrBandsIndicator::step(const CandleLog& log, size_t index) {
        const Candle& c = log.at(index);
        const Candle* prev = index > 0 ? &log.at(index - 1) : nullptr;

        size_t period = static_cast<size_t>(params_.period);

        closes_.push_back(c.close);
        trueRanges_.push_back(trueRange(c, prev));
        while (closes_.size() > period) closes_.pop_front();
        while (trueRanges_.size() > period) trueRanges_.pop_front();

        if (closes_.size() < period) {
            output(UPPER).push_back(std::nullopt);
            output(LOWER).push_back(std::nullopt);
            return;
        }

        // O(period): means are re-summed over the window, no running sum
        double sma = mean(closes_);
        double atr = mean(trueRanges_);

        output(UPPER).push_back(sma + params_.multiplier * atr);
        output(LOWER).push_back(sma - params_.multiplier * atr);
    }

} // namespace candle

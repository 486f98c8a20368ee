#include "IndicatorEngine.hpp"
#include "EmaIndicator.hpp"
#include "RsiIndicator.hpp"
#include "SupertrendIndicator.hpp"
#include "AtrBandsIndicator.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace candle {

    IndicatorEngine::IndicatorEngine() {
        slots_[IndicatorKind::EMA].indicator = std::make_unique<EmaIndicator>();
        slots_[IndicatorKind::RSI].indicator = std::make_unique<RsiIndicator>();
        slots_[IndicatorKind::SUPERTREND].indicator = std::make_unique<SupertrendIndicator>();
        slots_[IndicatorKind::ATR_BANDS].indicator = std::make_unique<AtrBandsIndicator>();
    }

    IndicatorEngine::Slot& IndicatorEngine::slot(IndicatorKind kind) {
        auto it = slots_.find(kind);
        if (it == slots_.end()) {
            throw std::invalid_argument("Indicator not registered: " + indicatorKindToString(kind));
        }
        return it->second;
    }

    const IndicatorEngine::Slot& IndicatorEngine::slot(IndicatorKind kind) const {
        return const_cast<IndicatorEngine*>(this)->slot(kind);
    }

    void IndicatorEngine::configure(const RuntimeConfig::IndicatorSet& config, const CandleLog& log) {
        for (auto& [kind, s] : slots_) {
            const auto& toggle = config.get(kind);
            const auto& current = s.indicator->getParams();
            if (current.period != toggle.period || current.multiplier != toggle.multiplier) {
                setParams(kind, toggle.params(), log);
            }
            setEnabled(kind, toggle.enabled, log);
        }
    }

    void IndicatorEngine::update(const CandleLog& log) {
        for (auto& [kind, s] : slots_) {
            if (s.enabled) {
                s.indicator->update(log);
            }
        }
    }

    void IndicatorEngine::enable(IndicatorKind kind, const CandleLog& log) {
        auto& s = slot(kind);
        size_t missed = log.size() - std::min(log.size(), s.indicator->getProcessedCount());
        s.enabled = true;
        s.indicator->update(log);
        Logger::info("{} enabled (caught up {} candles)", s.indicator->getName(), missed);
    }

    void IndicatorEngine::disable(IndicatorKind kind) {
        auto& s = slot(kind);
        s.enabled = false;
        Logger::info("{} disabled", s.indicator->getName());
    }

    void IndicatorEngine::setEnabled(IndicatorKind kind, bool enabled, const CandleLog& log) {
        if (enabled == isEnabled(kind)) return;
        if (enabled) {
            enable(kind, log);
        }
        else {
            disable(kind);
        }
    }

    bool IndicatorEngine::isEnabled(IndicatorKind kind) const {
        return slot(kind).enabled;
    }

    void IndicatorEngine::setParams(IndicatorKind kind, const IndicatorParams& params, const CandleLog& log) {
        auto& s = slot(kind);
        s.indicator->setParams(params);
        if (s.enabled) {
            s.indicator->update(log);
        }
        Logger::info("{} parameters set: period={} multiplier={}",
            s.indicator->getName(), params.period, params.multiplier);
    }

    const Indicator& IndicatorEngine::get(IndicatorKind kind) const {
        return *slot(kind).indicator;
    }

    std::map<std::string, IndicatorSeries> IndicatorEngine::sliceOutputs(size_t start, size_t end) const {
        std::map<std::string, IndicatorSeries> result;
        for (const auto& [kind, s] : slots_) {
            if (!s.enabled) continue;

            for (const auto& [name, series] : s.indicator->getOutputs()) {
                size_t from = std::min(start, series.size());
                size_t to = std::min(end, series.size());
                result[name] = IndicatorSeries(series.begin() + from, series.begin() + to);
            }
        }
        return result;
    }

} // namespace candle

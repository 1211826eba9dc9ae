#include "mtc/history/HistoryFetcher.hpp"
#include "mtc/data/BarNormalizer.hpp"
#include "mtc/data/Resolution.hpp"

#include <cstdio>

namespace mtc {

static constexpr std::int64_t kFallbackWindowMs = 7LL * 24 * 60 * 60 * 1000;

HistoryFetcher::HistoryFetcher(FrameManager& frames)
  : frames_(frames), self_(std::make_shared<HistoryFetcher*>(this)) {}

void HistoryFetcher::failAll(const std::string& error) {
  for (const auto& id : frames_.activeIds()) {
    FrameState& st = frames_.ensureState(id);
    st.loading = false;
    st.error = error;
  }
}

void HistoryFetcher::invalidate() {
  token_++;
  pending_ = 0;
}

std::uint64_t HistoryFetcher::refresh(const std::string& symbol, bool force,
                                      std::int64_t nowMs) {
  if (symbol.empty()) return 0;
  if (!provider_) {
    failAll("Broker history unavailable.");
    return 0;
  }
  if (!connected_) {
    failAll("Connect " + brokerLabel_ + " to load history.");
    return 0;
  }
  if (!force && pending_ > 0) return 0;

  std::uint64_t token = ++token_;
  std::vector<const FrameConfig*> active = frames_.activeConfigs();

  // One extra count keeps a synchronous provider from settling the cycle
  // before every request has been issued.
  pending_ = static_cast<int>(active.size()) + 1;

  std::weak_ptr<HistoryFetcher*> weak = self_;
  for (const FrameConfig* frame : active) {
    FrameState& st = frames_.ensureState(frame->id);
    st.loading = true;
    st.error.clear();

    std::int64_t resMs = resolutionMs(frame->resolution);
    HistoryRequest req;
    req.symbol = symbol;
    req.resolution = frame->resolution;
    req.fromMs = resMs > 0 ? nowMs - resMs * frame->lookbackBars : nowMs - kFallbackWindowMs;
    req.toMs = nowMs;
    req.maxAgeMs = force ? 0 : frame->maxAgeMs;

    std::string frameId = frame->id;
    provider_->getHistorySeries(req, [weak, token, frameId, nowMs](const HistoryResponse& res) {
      auto alive = weak.lock();
      if (!alive) return;
      (*alive)->apply(token, frameId, nowMs, res);
    });
  }
  settle(token);
  return token;
}

void HistoryFetcher::apply(std::uint64_t token, const std::string& frameId,
                           std::int64_t nowMs, const HistoryResponse& res) {
  if (token != token_) {
    staleDiscarded_++;
    std::fprintf(stderr, "HistoryFetcher::apply: discarding stale response for %s (token %llu, current %llu)\n",
                 frameId.c_str(), static_cast<unsigned long long>(token),
                 static_cast<unsigned long long>(token_));
    return;
  }

  FrameState& st = frames_.ensureState(frameId);
  const FrameConfig* frame = findFramePreset(frameId);

  NormalizeResult norm;
  bool parsed = res.ok && normalizeBarsJson(res.barsJson, norm);
  if (parsed && frame) {
    if (norm.dropped > 0) {
      std::fprintf(stderr, "HistoryFetcher::apply: %s dropped %u malformed bars\n",
                   frameId.c_str(), norm.dropped);
    }
    std::size_t cap = frame->capacity();
    if (norm.bars.size() > cap) {
      norm.bars.erase(norm.bars.begin(),
                      norm.bars.begin() + static_cast<std::ptrdiff_t>(norm.bars.size() - cap));
    }
    st.bars = std::move(norm.bars);
    st.updatedAtMs = res.fetchedAtMs > 0 ? res.fetchedAtMs : nowMs;
    st.source = res.source;
    if (res.hasCoverage) {
      st.coverage = res.coverage;
    } else {
      st.coverage = computeCoverage(st.bars, resolutionMs(frame->resolution));
    }
    st.hasCoverage = true;
    st.error.clear();
    st.token = token;
  } else {
    if (res.ok && !parsed) {
      std::fprintf(stderr, "HistoryFetcher::apply: %s returned an unreadable payload\n",
                   frameId.c_str());
    }
    st.error = res.error.empty() ? "Failed to load history." : res.error;
    std::fprintf(stderr, "HistoryFetcher::apply: %s failed: %s\n",
                 frameId.c_str(), st.error.c_str());
  }
  st.loading = false;
  settle(token);
}

void HistoryFetcher::settle(std::uint64_t token) {
  if (token != token_ || pending_ <= 0) return;
  if (--pending_ == 0 && onComplete_) onComplete_(token);
}

} // namespace mtc

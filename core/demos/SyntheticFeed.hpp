#pragma once
// Deterministic random-walk history and quotes for the demos.

#include "mtc/broker/HistoryProvider.hpp"
#include "mtc/data/Resolution.hpp"
#include "mtc/live/Quote.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace demo {

class Lcg {
public:
  explicit Lcg(std::uint32_t seed) : seed_(seed) {}
  // Uniform in [-1, 1].
  double next() {
    seed_ = seed_ * 1103515245u + 12345u;
    return static_cast<double>((seed_ >> 16) & 0x7FFF) / 16383.5 - 1.0;
  }

private:
  std::uint32_t seed_;
};

// Answers synchronously with a random walk anchored at basePrice.
class SyntheticHistory : public mtc::HistoryProvider {
public:
  explicit SyntheticHistory(double basePrice) : base_(basePrice) {}

  void getHistorySeries(const mtc::HistoryRequest& req, mtc::HistoryCallback done) override {
    mtc::HistoryResponse res;
    std::int64_t resMs = mtc::resolutionMs(req.resolution);
    if (resMs <= 0) {
      res.error = "Unsupported resolution " + req.resolution;
      done(res);
      return;
    }

    Lcg rng(static_cast<std::uint32_t>(resMs / 1000) * 2654435761u);
    double vol = base_ * 0.0004 * std::sqrt(static_cast<double>(resMs) / 60000.0);
    double price = base_;
    std::string json = "[";
    std::int64_t first = mtc::bucketStart(req.fromMs, resMs);
    std::int64_t last = mtc::bucketStart(req.toMs, resMs);
    bool comma = false;
    char buf[192];
    for (std::int64_t t = first; t <= last; t += resMs) {
      double o = price;
      double c = o + rng.next() * vol;
      double h = std::fmax(o, c) + std::fabs(rng.next()) * vol * 0.5;
      double l = std::fmin(o, c) - std::fabs(rng.next()) * vol * 0.5;
      std::snprintf(buf, sizeof(buf),
                    "%s{\"t\":%lld,\"o\":%.5f,\"h\":%.5f,\"l\":%.5f,\"c\":%.5f,\"v\":%d}",
                    comma ? "," : "", static_cast<long long>(t), o, h, l, c,
                    100 + static_cast<int>(std::fabs(rng.next()) * 900));
      json += buf;
      comma = true;
      price = c;
    }
    json += "]";
    lastClose_ = price;

    res.ok = true;
    res.barsJson = json;
    res.fetchedAtMs = req.toMs;
    res.source = "synthetic";
    done(res);
  }

  double lastClose() const { return lastClose_; }

private:
  double base_;
  double lastClose_{0};
};

inline mtc::LiveQuote makeQuote(const std::string& symbol, double mid, std::int64_t ts) {
  mtc::LiveQuote q;
  q.symbol = symbol;
  q.bid = mid - 0.00008;
  q.ask = mid + 0.00008;
  q.hasBid = q.hasAsk = true;
  q.timestampMs = ts;
  return q;
}

} // namespace demo

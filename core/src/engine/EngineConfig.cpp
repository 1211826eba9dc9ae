#include "mtc/engine/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace mtc {

namespace {

bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

void readPositive(const rapidjson::Value& obj, const char* key, double& field) {
  double v = 0;
  if (readNumber(obj, key, v) && v > 0) field = v;
}

void readPositiveMs(const rapidjson::Value& obj, const char* key, std::int64_t& field) {
  double v = 0;
  if (readNumber(obj, key, v) && v > 0) field = static_cast<std::int64_t>(v);
}

void readNonNegativeMs(const rapidjson::Value& obj, const char* key, std::int64_t& field) {
  double v = 0;
  if (readNumber(obj, key, v) && v >= 0) field = static_cast<std::int64_t>(v);
}

void readString(const rapidjson::Value& obj, const char* key, std::string& field) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsString()) field = it->value.GetString();
}

} // namespace

bool loadEngineConfig(const std::string& json, EngineConfig& cfg) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  readPositive(doc, "hitTolerancePx", cfg.hitTolerancePx);
  readPositive(doc, "dragConfirmPx", cfg.dragConfirmPx);

  double v = 0;
  if (readNumber(doc, "dedupBandFraction", v) && v >= 0 && v < 1) cfg.dedupBandFraction = v;
  if (readNumber(doc, "maxSelectedLevels", v) && v >= 0 && v <= 64) cfg.maxSelectedLevels = static_cast<int>(v);
  if (readNumber(doc, "refreshJitter", v) && v >= 0 && v <= 0.6) cfg.refreshJitter = v;
  if (readNumber(doc, "maxActiveFrames", v) && v >= 1 && v <= 16) cfg.maxActiveFrames = static_cast<int>(v);

  readPositiveMs(doc, "refreshIntervalMs", cfg.refreshIntervalMs);
  readNonNegativeMs(doc, "quoteRepeatWindowMs", cfg.quoteRepeatWindowMs);
  readNonNegativeMs(doc, "quoteMinIntervalMs", cfg.quoteMinIntervalMs);
  readPositiveMs(doc, "liveMarkerFreshMs", cfg.liveMarkerFreshMs);

  readString(doc, "fontPath", cfg.fontPath);
  std::string broker;
  readString(doc, "brokerLabel", broker);
  if (!broker.empty()) cfg.brokerLabel = broker;

  auto frames = doc.FindMember("activeFrames");
  if (frames != doc.MemberEnd() && frames->value.IsArray()) {
    std::vector<std::string> ids;
    for (const auto& f : frames->value.GetArray()) {
      if (f.IsString()) ids.emplace_back(f.GetString());
    }
    if (!ids.empty()) cfg.activeFrames = std::move(ids);
  }
  return true;
}

bool loadEngineConfigFile(const std::string& path, EngineConfig& cfg) {
  std::ifstream f(path);
  if (!f) {
    std::fprintf(stderr, "loadEngineConfigFile: cannot open %s\n", path.c_str());
    return false;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  if (!loadEngineConfig(ss.str(), cfg)) {
    std::fprintf(stderr, "loadEngineConfigFile: %s is not a JSON object\n", path.c_str());
    return false;
  }
  return true;
}

std::string engineConfigToJson(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("hitTolerancePx", cfg.hitTolerancePx, alloc);
  doc.AddMember("dedupBandFraction", cfg.dedupBandFraction, alloc);
  doc.AddMember("dragConfirmPx", cfg.dragConfirmPx, alloc);
  doc.AddMember("maxSelectedLevels", cfg.maxSelectedLevels, alloc);
  doc.AddMember("refreshIntervalMs", static_cast<int64_t>(cfg.refreshIntervalMs), alloc);
  doc.AddMember("refreshJitter", cfg.refreshJitter, alloc);
  doc.AddMember("maxActiveFrames", cfg.maxActiveFrames, alloc);
  doc.AddMember("quoteRepeatWindowMs", static_cast<int64_t>(cfg.quoteRepeatWindowMs), alloc);
  doc.AddMember("quoteMinIntervalMs", static_cast<int64_t>(cfg.quoteMinIntervalMs), alloc);
  doc.AddMember("liveMarkerFreshMs", static_cast<int64_t>(cfg.liveMarkerFreshMs), alloc);
  doc.AddMember("brokerLabel", rapidjson::Value(cfg.brokerLabel.c_str(), alloc), alloc);
  doc.AddMember("fontPath", rapidjson::Value(cfg.fontPath.c_str(), alloc), alloc);

  rapidjson::Value frames(rapidjson::kArrayType);
  for (const auto& id : cfg.activeFrames) {
    frames.PushBack(rapidjson::Value(id.c_str(), alloc), alloc);
  }
  doc.AddMember("activeFrames", frames, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace mtc

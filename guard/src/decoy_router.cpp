#include "decoy_router.h"

#include <array>
#include <utility>

#include "decoy_presets.h"
#include "hex_utils.h"
#include "platform_log.h"
#include "platform_random.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "decoy";

}  // namespace

DecoyRouter::DecoyRouter(const DecoyConfig& cfg, const SecurityState& state)
    : state_(state) {
  decoys_[FlavorIndex(Flavor::kHush)].preset = cfg.hush_preset;
  decoys_[FlavorIndex(Flavor::kClassified)].preset = cfg.classified_preset;
}

std::string DecoyRouter::NextMessageId() {
  std::array<std::uint8_t, 8> raw{};
  if (platform::RandomBytes(raw.data(), raw.size())) {
    return common::BytesToHexLower(raw.data(), raw.size());
  }
  return "m" + std::to_string(++id_counter_);
}

std::vector<Message> DecoyRouter::VisibleMessages(Flavor flavor,
                                                  std::uint64_t now_ms) const {
  if (state_.is_decoy_mode) {
    const DecoySet& set = decoys_[FlavorIndex(flavor)];
    if (set.burned) {
      return {};
    }
    if (!set.custom_messages.empty()) {
      return set.custom_messages;
    }
    return BuildDecoyPreset(flavor, set.preset, now_ms);
  }
  std::vector<Message> out;
  for (const auto& msg : real_) {
    if (msg.context == flavor) {
      out.push_back(msg);
    }
  }
  return out;
}

bool DecoyRouter::Append(Flavor flavor,
                         Role role,
                         const std::string& text,
                         std::uint64_t now_ms,
                         std::string& error) {
  if (text.empty()) {
    error = "message text empty";
    return false;
  }
  Message msg;
  msg.id = NextMessageId();
  msg.role = role;
  msg.text = text;
  msg.created_at_ms = now_ms;
  msg.context = flavor;
  if (state_.is_decoy_mode && role != Role::kSystem) {
    DecoySet& set = decoys_[FlavorIndex(flavor)];
    set.custom_messages.push_back(std::move(msg));
    set.burned = false;
    return true;
  }
  real_.push_back(std::move(msg));
  return true;
}

void DecoyRouter::OnDecoyModeChanged(bool entering) {
  if (entering) {
    return;
  }
  for (auto& set : decoys_) {
    set.burned = false;
  }
}

bool DecoyRouter::SetDecoyPreset(Flavor flavor,
                                 DecoyPreset preset,
                                 std::string& error) {
  if (!SupportsDecoyPreset(flavor) && preset != DecoyPreset::kNone) {
    error = std::string("flavor has no decoy presets: ") + FlavorName(flavor);
    return false;
  }
  decoys_[FlavorIndex(flavor)].preset = preset;
  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "decoy preset changed",
                     {{"flavor", FlavorName(flavor)},
                      {"preset", DecoyPresetName(preset)}});
  return true;
}

}  // namespace dz::guard

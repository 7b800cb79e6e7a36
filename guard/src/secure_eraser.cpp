#include "secure_eraser.h"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "platform_log.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "eraser";
constexpr std::uint32_t kPrintableFirst = 33;
constexpr std::uint32_t kPrintableCount = 94;  // 33..126
constexpr int kMaxRegenerate = 4;

bool FillRandomPrintable(std::string& buf) {
  for (auto& ch : buf) {
    std::uint32_t v = 0;
    if (!platform::RandomBelow(kPrintableCount, v)) {
      return false;
    }
    ch = static_cast<char>(kPrintableFirst + v);
  }
  return true;
}

void FillPattern(std::string& buf, std::size_t shift) {
  for (std::size_t i = 0; i < buf.size(); ++i) {
    buf[i] = static_cast<char>(kPrintableFirst +
                               ((i * 7 + shift) % kPrintableCount));
  }
}

}  // namespace

SecureEraser::SecureEraser(DecoyRouter& router) : router_(router) {}

void SecureEraser::OverwriteText(std::string& text) {
  if (text.empty()) {
    return;
  }
  std::string fill(text.size(), '\0');
  bool rng_ok = true;
  for (int attempt = 0; attempt < kMaxRegenerate; ++attempt) {
    if (rng_ok && !FillRandomPrintable(fill)) {
      rng_ok = false;
      platform::log::Log(platform::log::Level::kError, kLogTag,
                         "rng failed, using fixed overwrite pattern");
    }
    if (!rng_ok) {
      FillPattern(fill, static_cast<std::size_t>(attempt));
    }
    if (fill != text) {
      break;
    }
  }
  std::memcpy(&text[0], fill.data(), fill.size());
  common::SecureWipe(fill);
}

void SecureEraser::Wipe(std::vector<Message>& messages) {
  for (auto& msg : messages) {
    OverwriteText(msg.text);
  }
  messages.clear();
}

void SecureEraser::WipeFlavor(Flavor flavor) {
  std::size_t wiped = 0;
  if (router_.decoy_mode()) {
    // Only the decoy side is reachable while decoy mode is on.
    DecoySet& set = router_.decoys_[FlavorIndex(flavor)];
    wiped = set.custom_messages.size();
    Wipe(set.custom_messages);
    set.burned = true;
  } else {
    auto& real = router_.real_;
    for (auto& msg : real) {
      if (msg.context == flavor) {
        OverwriteText(msg.text);
        ++wiped;
      }
    }
    real.erase(std::remove_if(real.begin(), real.end(),
                              [flavor](const Message& msg) {
                                return msg.context == flavor;
                              }),
               real.end());
  }
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "flavor wiped",
                     {{"flavor", FlavorName(flavor)},
                      {"messages", std::to_string(wiped)}});
}

void SecureEraser::WipeAll() {
  std::size_t wiped = router_.real_.size();
  for (auto& msg : router_.real_) {
    OverwriteText(msg.text);
  }
  for (auto& set : router_.decoys_) {
    wiped += set.custom_messages.size();
    for (auto& msg : set.custom_messages) {
      OverwriteText(msg.text);
    }
  }
  router_.real_.clear();
  for (auto& set : router_.decoys_) {
    set.custom_messages.clear();
    set.burned = true;
  }
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "all content wiped",
                     {{"messages", std::to_string(wiped)}});
}

}  // namespace dz::guard

#include "decoy_presets.h"

#include <cstddef>
#include <string>
#include <utility>

namespace dz::guard {

namespace {

struct PresetLine {
  Role role;
  const char* text;
};

constexpr std::uint64_t kFirstOffsetMs = 3600000;
constexpr std::uint64_t kStepMs = 100000;

constexpr PresetLine kHushGeneral[] = {
    {Role::kUser, "What's a good birthday gift for my mom?"},
    {Role::kAssistant,
     "Some thoughtful options: a nice scarf or jewelry, a spa day gift card, "
     "a photo book of family memories, her favorite perfume, or tickets to a "
     "show she'd enjoy. What are her interests?"},
    {Role::kUser, "She likes gardening"},
    {Role::kAssistant,
     "Perfect! Consider a set of quality gardening tools, a subscription to a "
     "seed-of-the-month club, a beautiful planter, or a book about garden "
     "design. A gift card to her favorite nursery would also be appreciated."},
};

constexpr PresetLine kHushStudy[] = {
    {Role::kUser, "What's the Pythagorean theorem?"},
    {Role::kAssistant,
     "The Pythagorean theorem states that in a right triangle, the square of "
     "the hypotenuse (c) equals the sum of squares of the other two sides (a "
     "and b). Written as: a\xC2\xB2 + b\xC2\xB2 = c\xC2\xB2"},
    {Role::kUser, "Can you give me an example?"},
    {Role::kAssistant,
     "Sure! If a triangle has sides of 3 and 4, the hypotenuse is: "
     "3\xC2\xB2 + 4\xC2\xB2 = 9 + 16 = 25, so c = \xE2\x88\x9A"
     "25 = 5. This is the famous 3-4-5 right triangle."},
};

constexpr PresetLine kHushMeal[] = {
    {Role::kUser, "What should I make for dinner tonight?"},
    {Role::kAssistant,
     "How about a simple stir-fry? You can use whatever vegetables you have, "
     "some protein like chicken or tofu, and serve over rice. Quick and "
     "healthy!"},
    {Role::kUser, "I have chicken and broccoli"},
    {Role::kAssistant,
     "Perfect combo! Cut chicken into strips, stir-fry until golden. Add "
     "broccoli florets, a splash of soy sauce, garlic, and ginger. Cook until "
     "broccoli is bright green but still crisp. Serve over rice with sesame "
     "seeds on top."},
};

constexpr PresetLine kHushAuto[] = {
    {Role::kUser, "What's the weather like today?"},
    {Role::kAssistant,
     "I don't have access to real-time weather data, but you can check your "
     "phone's weather app or weather.com for current conditions in your "
     "area."},
    {Role::kUser, "Thanks, what time is sunset?"},
    {Role::kAssistant,
     "Sunset times vary by location and date. In most of the US during "
     "winter, sunset is typically between 4:30-5:30 PM. Your phone's weather "
     "app usually shows today's exact sunset time for your location."},
};

constexpr PresetLine kClassifiedGeneral[] = {
    {Role::kUser, "SYSTEM STATUS"},
    {Role::kAssistant,
     "> ALL SYSTEMS NOMINAL\n> UPTIME: 99.7%\n> LAST MAINTENANCE: 72H AGO"},
    {Role::kUser, "RUN DIAGNOSTICS"},
    {Role::kAssistant,
     "> DIAGNOSTIC COMPLETE\n> CPU: OK\n> MEMORY: OK\n> STORAGE: 42% "
     "UTILIZED\n> NO ANOMALIES DETECTED"},
};

constexpr PresetLine kClassifiedStudy[] = {
    {Role::kUser, "EXPLAIN ENCRYPTION"},
    {Role::kAssistant,
     "> ENCRYPTION: PROCESS OF ENCODING DATA\n> PURPOSE: PREVENT "
     "UNAUTHORIZED ACCESS\n> TYPES: SYMMETRIC (AES), ASYMMETRIC (RSA)\n> "
     "RECOMMENDATION: USE AES-256 FOR DATA AT REST"},
    {Role::kUser, "WHAT IS AES"},
    {Role::kAssistant,
     "> AES: ADVANCED ENCRYPTION STANDARD\n> BLOCK CIPHER: 128-BIT BLOCKS\n> "
     "KEY SIZES: 128, 192, OR 256 BITS\n> STATUS: US GOVERNMENT APPROVED\n> "
     "WIDELY ADOPTED SINCE 2001"},
};

constexpr PresetLine kClassifiedMeal[] = {
    {Role::kUser, "QUERY NUTRITIONAL DATA"},
    {Role::kAssistant,
     "> DAILY TARGETS:\n> CALORIES: 2000\n> PROTEIN: 50G\n> CARBS: 250G\n> "
     "FAT: 65G\n> AWAITING SPECIFIC QUERY"},
};

constexpr PresetLine kClassifiedAuto[] = {
    {Role::kUser, "STATUS REPORT"},
    {Role::kAssistant,
     "> TERMINAL ACTIVE\n> SECURE CHANNEL ESTABLISHED\n> AWAITING COMMANDS"},
};

template <std::size_t N>
std::vector<Message> Materialize(const PresetLine (&lines)[N],
                                 char id_prefix,
                                 Flavor flavor,
                                 std::uint64_t now_ms) {
  std::vector<Message> out;
  out.reserve(N);
  for (std::size_t i = 0; i < N; ++i) {
    const std::uint64_t offset = kFirstOffsetMs - kStepMs * i;
    Message msg;
    msg.id = std::string(1, id_prefix) + std::to_string(i + 1);
    msg.role = lines[i].role;
    msg.text = lines[i].text;
    msg.created_at_ms = now_ms > offset ? now_ms - offset : 0;
    msg.context = flavor;
    out.push_back(std::move(msg));
  }
  return out;
}

}  // namespace

std::vector<Message> BuildDecoyPreset(Flavor flavor,
                                      DecoyPreset preset,
                                      std::uint64_t now_ms) {
  if (flavor == Flavor::kHush) {
    switch (preset) {
      case DecoyPreset::kGeneralAssistant:
        return Materialize(kHushGeneral, 'd', flavor, now_ms);
      case DecoyPreset::kStudyHelper:
        return Materialize(kHushStudy, 'd', flavor, now_ms);
      case DecoyPreset::kMealPlanning:
        return Materialize(kHushMeal, 'd', flavor, now_ms);
      case DecoyPreset::kAuto:
        return Materialize(kHushAuto, 'd', flavor, now_ms);
      case DecoyPreset::kNone:
        break;
    }
    return {};
  }
  if (flavor == Flavor::kClassified) {
    switch (preset) {
      case DecoyPreset::kGeneralAssistant:
        return Materialize(kClassifiedGeneral, 'c', flavor, now_ms);
      case DecoyPreset::kStudyHelper:
        return Materialize(kClassifiedStudy, 'c', flavor, now_ms);
      case DecoyPreset::kMealPlanning:
        return Materialize(kClassifiedMeal, 'c', flavor, now_ms);
      case DecoyPreset::kAuto:
        return Materialize(kClassifiedAuto, 'c', flavor, now_ms);
      case DecoyPreset::kNone:
        break;
    }
  }
  return {};
}

}  // namespace dz::guard

#include "guard_types.h"

#include <cctype>

namespace dz::guard {

namespace {

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

}  // namespace

const char* FlavorName(Flavor flavor) {
  switch (flavor) {
    case Flavor::kHush:
      return "hush";
    case Flavor::kClassified:
      return "classified";
    case Flavor::kDiscretion:
      return "discretion";
  }
  return "hush";
}

const char* RoleName(Role role) {
  switch (role) {
    case Role::kUser:
      return "user";
    case Role::kAssistant:
      return "assistant";
    case Role::kSystem:
      return "system";
  }
  return "user";
}

const char* DecoyPresetName(DecoyPreset preset) {
  switch (preset) {
    case DecoyPreset::kNone:
      return "none";
    case DecoyPreset::kAuto:
      return "auto";
    case DecoyPreset::kStudyHelper:
      return "study_helper";
    case DecoyPreset::kMealPlanning:
      return "meal_planning";
    case DecoyPreset::kGeneralAssistant:
      return "general_assistant";
  }
  return "none";
}

bool ParseFlavor(const std::string& text, Flavor& out) {
  const std::string t = ToLower(text);
  if (t == "hush") {
    out = Flavor::kHush;
    return true;
  }
  if (t == "classified") {
    out = Flavor::kClassified;
    return true;
  }
  if (t == "discretion") {
    out = Flavor::kDiscretion;
    return true;
  }
  return false;
}

bool ParseRole(const std::string& text, Role& out) {
  const std::string t = ToLower(text);
  if (t == "user") {
    out = Role::kUser;
    return true;
  }
  if (t == "assistant" || t == "ai") {
    out = Role::kAssistant;
    return true;
  }
  if (t == "system") {
    out = Role::kSystem;
    return true;
  }
  return false;
}

bool ParseDecoyPreset(const std::string& text, DecoyPreset& out) {
  const std::string t = ToLower(text);
  if (t.empty() || t == "none" || t == "off") {
    out = DecoyPreset::kNone;
    return true;
  }
  if (t == "auto") {
    out = DecoyPreset::kAuto;
    return true;
  }
  if (t == "study_helper" || t == "study") {
    out = DecoyPreset::kStudyHelper;
    return true;
  }
  if (t == "meal_planning" || t == "meal") {
    out = DecoyPreset::kMealPlanning;
    return true;
  }
  if (t == "general_assistant" || t == "general") {
    out = DecoyPreset::kGeneralAssistant;
    return true;
  }
  return false;
}

}  // namespace dz::guard

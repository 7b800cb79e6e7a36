#ifndef DZ_GUARD_DECOY_ROUTER_H
#define DZ_GUARD_DECOY_ROUTER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "guard_config.h"
#include "guard_types.h"

namespace dz::guard {

// Owns the real message collection and one DecoySet per flavor. Which one a
// call touches is decided by |state.is_decoy_mode|; the state itself belongs to
// the coordinator.
class DecoyRouter {
 public:
  DecoyRouter(const DecoyConfig& cfg, const SecurityState& state);

  DecoyRouter(const DecoyRouter&) = delete;
  DecoyRouter& operator=(const DecoyRouter&) = delete;

  std::vector<Message> VisibleMessages(Flavor flavor,
                                       std::uint64_t now_ms) const;

  // System-role messages always land in the real collection.
  bool Append(Flavor flavor,
              Role role,
              const std::string& text,
              std::uint64_t now_ms,
              std::string& error);

  // Called by the coordinator after it flips is_decoy_mode. Leaving decoy
  // mode clears every burn flag; entering keeps them.
  void OnDecoyModeChanged(bool entering);

  bool SetDecoyPreset(Flavor flavor, DecoyPreset preset, std::string& error);

  const DecoySet& decoy_set(Flavor flavor) const {
    return decoys_[FlavorIndex(flavor)];
  }
  std::size_t real_message_count() const { return real_.size(); }
  bool decoy_mode() const { return state_.is_decoy_mode; }

 private:
  friend class SecureEraser;

  std::string NextMessageId();

  const SecurityState& state_;
  std::vector<Message> real_;
  std::array<DecoySet, kFlavorCount> decoys_;
  std::uint64_t id_counter_{0};
};

}  // namespace dz::guard

#endif  // DZ_GUARD_DECOY_ROUTER_H

#ifndef DZ_GUARD_DECOY_PRESETS_H
#define DZ_GUARD_DECOY_PRESETS_H

#include <cstdint>
#include <vector>

#include "guard_types.h"

namespace dz::guard {

// Built-in decoy conversation for |flavor|. Empty for kNone and for flavors
// without preset support. Timestamps are laid out backwards from |now_ms|.
std::vector<Message> BuildDecoyPreset(Flavor flavor,
                                      DecoyPreset preset,
                                      std::uint64_t now_ms);

}  // namespace dz::guard

#endif  // DZ_GUARD_DECOY_PRESETS_H

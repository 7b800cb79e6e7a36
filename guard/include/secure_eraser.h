#ifndef DZ_GUARD_SECURE_ERASER_H
#define DZ_GUARD_SECURE_ERASER_H

#include <string>
#include <vector>

#include "decoy_router.h"
#include "guard_types.h"

namespace dz::guard {

// Best-effort in-memory scrubbing: message text is overwritten with random
// printable ASCII (33..126) of the same byte length before the message is
// dropped. Copies held outside the router are not reached.
class SecureEraser {
 public:
  explicit SecureEraser(DecoyRouter& router);

  // Rewrites |text| in place. The result always differs from the input when
  // the input is non-empty.
  static void OverwriteText(std::string& text);
  // Overwrites every message, then empties |messages|.
  static void Wipe(std::vector<Message>& messages);

  // Outside decoy mode the real messages of |flavor| go. In decoy mode only
  // the flavor's custom decoy messages go and the flavor is marked burned;
  // the real collection is left alone.
  void WipeFlavor(Flavor flavor);
  // Empties every collection and burns every flavor. Leaving decoy mode is
  // the coordinator's job.
  void WipeAll();

 private:
  DecoyRouter& router_;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_SECURE_ERASER_H

#include "runbox/common/version.hpp"

namespace runbox::common {

std::string version() {
#ifdef RUNBOX_VERSION
  return RUNBOX_VERSION;
#else
  return "0.1.0";
#endif
}

} // namespace runbox::common

#include "flakeid/id/entropy.h"

#include <random>

namespace flakeid::id {

std::uint32_t SystemEntropySource::next_u32() {
  std::random_device device;
  return static_cast<std::uint32_t>(device());
}

}  // namespace flakeid::id

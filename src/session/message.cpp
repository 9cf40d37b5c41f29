// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/message.hpp"

namespace custody {
namespace session {

const char *DirectResponseModeName(DirectResponseMode mode) {
  switch (mode) {
  case DirectResponseMode::NONE:
    return "none";
  case DirectResponseMode::ALL:
    return "all";
  case DirectResponseMode::THREAD:
    return "thread";
  }
  return "unknown";
}

} // namespace session
} // namespace custody

#include "runtime/state.h"

namespace llmgate {

std::atomic<bool> g_running_flag{true};

}  // namespace llmgate

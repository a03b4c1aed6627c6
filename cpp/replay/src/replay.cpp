#define REPLAY_IMPLEMENTATION
#include <replay/replay.hpp>

#pragma once

#include "byte_cursor.hpp"
#include "crc32.hpp"
#include "data_provider.hpp"
#include "decompression.hpp"
#include "errors.hpp"
#include "live_player.hpp"
#include "log.hpp"
#include "mcap_provider.hpp"
#include "options.hpp"
#include "player.hpp"
#include "problem_store.hpp"
#include "random_access_player.hpp"
#include "readable.hpp"
#include "record_parser.hpp"
#include "state_emitter.hpp"
#include "stream_reader.hpp"
#include "time.hpp"
#include "types.hpp"
#include "writer.hpp"

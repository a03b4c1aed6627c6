#pragma once

/** REPLAY_PUBLIC marks the public surface of the library. Define it before including any replay
 *  header to override the default. The translation unit that defines REPLAY_IMPLEMENTATION exports
 *  the symbols on Windows; everywhere else they are imported.
 */
#ifndef REPLAY_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef REPLAY_IMPLEMENTATION
#      define REPLAY_PUBLIC __declspec(dllexport)
#    else
#      define REPLAY_PUBLIC __declspec(dllimport)
#    endif
#  elif __GNUC__ >= 4
#    define REPLAY_PUBLIC __attribute__((visibility("default")))
#  else
#    define REPLAY_PUBLIC
#  endif
#endif

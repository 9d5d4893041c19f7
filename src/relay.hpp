#pragma once
#include "sys.hpp"

#include <functional>
#include <string>
#include <string_view>

// Receives one chunk of captured text. Called on a drain thread.
using Sink = std::function<void(const std::string&)>;

// Removes ESC + CSI sequences and ESC + single-character escapes.
std::string strip_ansi(std::string_view text);

// UTF-8 with every invalid or truncated sequence replaced by U+FFFD.
std::string decode_lossy(std::string_view bytes);

// Length of the longest prefix of `bytes` that does not end inside a
// multi-byte UTF-8 sequence.
size_t utf8_safe_prefix(std::string_view bytes);

// Spawns a detached thread that owns `fd`, reads it to EOF and hands each
// line (or 4 KiB slice of a longer one) to `sink`, decoded and stripped,
// in the order read. A read error is reported to the sink as a
// "[relay] <stream> read failed: ..." line and ends the thread.
void drain(sys::Fd fd, Sink sink, std::string stream_name);

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Upper bound on the inflated size of a single stream. Random bytes that
// happen to decode as DEFLATE can expand far beyond anything a replay holds.
inline constexpr size_t kMaxInflatedSize = 16u * 1024u * 1024u;

// Decodes a raw DEFLATE stream (RFC 1951). On success, consumed is the number
// of input bytes up to the byte boundary that follows the final block.
bool InflateRaw(const uint8_t* src, size_t srcLen, std::vector<uint8_t>& out,
                size_t& consumed, size_t maxOutput = kMaxInflatedSize);

uint32_t Adler32(const uint8_t* data, size_t len);

// Decodes a zlib stream (RFC 1950): 2-byte header, DEFLATE body, big-endian
// Adler-32 trailer. Bytes after the trailer are ignored. streamLen receives the
// full stream length including header and trailer.
bool InflateZlib(const uint8_t* src, size_t srcLen, std::vector<uint8_t>& out,
                 size_t& streamLen);

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#include <pk3/deflate.hpp>

namespace pk3 {

namespace {

// zlib counts in uInt; feed large buffers in slices of at most this size
constexpr size_t maxChunk = std::numeric_limits<uInt>::max();

// Ends the zlib stream on every exit path
struct DeflateGuard {
  z_stream *stream;
  ~DeflateGuard() { deflateEnd(stream); }
};

struct InflateGuard {
  z_stream *stream;
  ~InflateGuard() { inflateEnd(stream); }
};

std::string zlibMessage(const z_stream &stream, int code) {
  if (stream.msg) {
    return fmt::format("{} ({})", stream.msg, code);
  }
  return fmt::format("zlib error {}", code);
}

} // namespace

std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> data,
                                               std::string *outError) {
  z_stream stream{};
  int rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                        Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    if (outError) {
      *outError = fmt::format("Failed to initialise deflate: {}", zlibMessage(stream, rc));
    }
    return std::nullopt;
  }
  DeflateGuard guard{&stream};

  std::vector<uint8_t> output(deflateBound(&stream, static_cast<uLong>(data.size())));
  size_t consumed = 0;
  size_t produced = 0;

  do {
    if (produced == output.size()) {
      output.resize(output.size() * 2 + 64);
    }

    size_t inChunk = std::min(data.size() - consumed, maxChunk);
    size_t outChunk = std::min(output.size() - produced, maxChunk);
    stream.next_in = const_cast<Bytef *>(data.data() + consumed);
    stream.avail_in = static_cast<uInt>(inChunk);
    stream.next_out = output.data() + produced;
    stream.avail_out = static_cast<uInt>(outChunk);

    bool lastInput = consumed + inChunk == data.size();
    rc = deflate(&stream, lastInput ? Z_FINISH : Z_NO_FLUSH);
    if (rc == Z_STREAM_ERROR) {
      if (outError) {
        *outError = fmt::format("Deflate failed: {}", zlibMessage(stream, rc));
      }
      return std::nullopt;
    }

    consumed += inChunk - stream.avail_in;
    produced += outChunk - stream.avail_out;
  } while (rc != Z_STREAM_END);

  output.resize(produced);
  return output;
}

std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> compressed,
                                               size_t expectedSize, std::string *outError) {
  z_stream stream{};
  int rc = inflateInit2(&stream, -MAX_WBITS);
  if (rc != Z_OK) {
    if (outError) {
      *outError = fmt::format("Failed to initialise inflate: {}", zlibMessage(stream, rc));
    }
    return std::nullopt;
  }
  InflateGuard guard{&stream};

  std::vector<uint8_t> output(expectedSize);
  size_t consumed = 0;
  size_t produced = 0;

  // zlib rejects a null output pointer even when nothing is to be written
  Bytef emptySink = 0;

  for (;;) {
    size_t inChunk = std::min(compressed.size() - consumed, maxChunk);
    size_t outChunk = std::min(output.size() - produced, maxChunk);
    stream.next_in = const_cast<Bytef *>(compressed.data() + consumed);
    stream.avail_in = static_cast<uInt>(inChunk);
    stream.next_out = output.empty() ? &emptySink : output.data() + produced;
    stream.avail_out = static_cast<uInt>(outChunk);

    rc = inflate(&stream, Z_NO_FLUSH);
    consumed += inChunk - stream.avail_in;
    produced += outChunk - stream.avail_out;

    if (rc == Z_STREAM_END) {
      break;
    }
    if (rc != Z_OK) {
      if (outError) {
        *outError = rc == Z_BUF_ERROR
                        ? fmt::format("Compressed data ends early or inflates past {} bytes",
                                      expectedSize)
                        : fmt::format("Inflate failed: {}", zlibMessage(stream, rc));
      }
      return std::nullopt;
    }
  }

  if (produced != expectedSize) {
    if (outError) {
      *outError = fmt::format("Inflated {} bytes, expected {}", produced, expectedSize);
    }
    return std::nullopt;
  }

  return output;
}

uint32_t crc32(std::span<const uint8_t> data) {
  uLong crc = ::crc32(0L, Z_NULL, 0);
  size_t pos = 0;
  while (pos < data.size()) {
    size_t chunk = std::min(data.size() - pos, maxChunk);
    crc = ::crc32(crc, data.data() + pos, static_cast<uInt>(chunk));
    pos += chunk;
  }
  return static_cast<uint32_t>(crc);
}

} // namespace pk3

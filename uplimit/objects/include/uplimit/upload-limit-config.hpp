#pragma once

#include <cstddef>
#include <string_view>

#include "uplimit/limit-policy.hpp"

namespace uplimit {

struct UploadLimitConfig {
  // Maximum allowed size (in bytes) of a request body. Requests exceeding this limit, either by their declared
  // Content-Length or while their body is streamed, are answered with 413 (Payload Too Large).
  // 0 is accepted and rejects any nonempty body.
  // Default: 4 MiB.
  std::size_t maxBodyBytes{std::size_t{4} << 20};

  // Upper bound of the number of bytes requested from the underlying body source on a single read, whatever the
  // amount asked by the handler. Memory held by a body read is bounded by this value. Must be > 0.
  // Default: 64 KiB.
  std::size_t maxChunkBytes{std::size_t{64} << 10};

  // Reject a request before reading its body when its Content-Length is larger than maxBodyBytes.
  // The streaming check is always installed, whatever this setting.
  // Default: true.
  bool declaredLengthCheck{true};

  // Add 'Connection: close' to 413 responses. The unread remainder of a rejected body is still in flight, so the
  // connection should generally not be reused.
  // Default: true.
  bool closeConnectionOnReject{true};

  // Validates config. Throws invalid_argument if it's not valid.
  void validate() const;

  // Builds the immutable limit policy corresponding to this config.
  [[nodiscard]] LimitPolicy policy() const noexcept { return LimitPolicy(maxBodyBytes); }

  // Adjust body size limit
  UploadLimitConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Adjust body size limit from a human readable string, for instance "512k", "4MiB" or "1G".
  // Throws std::invalid_argument if the string cannot be parsed.
  UploadLimitConfig& withMaxBodyBytes(std::string_view maxBodyBytesStr);

  // Adjust per-read chunk cap
  UploadLimitConfig& withMaxChunkBytes(std::size_t maxChunkBytes);

  // Toggle early rejection from the declared Content-Length
  UploadLimitConfig& withDeclaredLengthCheck(bool on = true);

  // Toggle 'Connection: close' on 413 responses
  UploadLimitConfig& withCloseConnectionOnReject(bool on = true);

  bool operator==(const UploadLimitConfig&) const noexcept = default;
};

}  // namespace uplimit

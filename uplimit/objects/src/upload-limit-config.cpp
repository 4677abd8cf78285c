#include "uplimit/upload-limit-config.hpp"

#include <cstddef>
#include <string_view>

#include "uplimit/invalid_argument_exception.hpp"
#include "uplimit/unitsparser.hpp"

namespace uplimit {

UploadLimitConfig& UploadLimitConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

UploadLimitConfig& UploadLimitConfig::withMaxBodyBytes(std::string_view maxBodyBytesStr) {
  this->maxBodyBytes = static_cast<std::size_t>(ParseNumberOfBytes(maxBodyBytesStr));
  return *this;
}

UploadLimitConfig& UploadLimitConfig::withMaxChunkBytes(std::size_t maxChunkBytes) {
  this->maxChunkBytes = maxChunkBytes;
  return *this;
}

UploadLimitConfig& UploadLimitConfig::withDeclaredLengthCheck(bool on) {
  this->declaredLengthCheck = on;
  return *this;
}

UploadLimitConfig& UploadLimitConfig::withCloseConnectionOnReject(bool on) {
  this->closeConnectionOnReject = on;
  return *this;
}

void UploadLimitConfig::validate() const {
  if (maxChunkBytes == 0) {
    throw invalid_argument("maxChunkBytes must be > 0");
  }
}

}  // namespace uplimit

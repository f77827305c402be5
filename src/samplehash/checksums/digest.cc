#include <glog/logging.h>
#include <samplehash/checksums/digest.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace samplehash {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

Digest::Digest() : bytes_() {}

Digest::Digest(const Bytes &bytes) : bytes_(bytes) {}

Digest Digest::FromString(const std::string &hex) {
  if (hex.size() != 2 * kSize) {
    throw std::invalid_argument(
        "digest must have " + std::to_string(2 * kSize) +
        " hex characters: '" + hex + "'");
  }

  Bytes bytes{};
  for (std::size_t i = 0; i < kSize; i++) {
    auto hi = HexValue(hex[2 * i]);
    auto lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("not a hex digest: '" + hex + "'");
    }
    bytes[i] = static_cast<uint8_t>(hi << 4 | lo);
  }

  auto count = bytes[0];
  if (count > 8 || (count > 0 && bytes[count] == 0)) {
    throw std::invalid_argument("malformed length in digest: '" + hex + "'");
  }
  return Digest(bytes);
}

const Digest::Bytes &Digest::GetBytes() const { return bytes_; }

int Digest::GetLengthByteCount() const { return bytes_[0]; }

uint64_t Digest::GetEmbeddedLength() const {
  auto count = GetLengthByteCount();
  CHECK_LE(count, 8) << "malformed digest " << ToString();

  uint64_t result = 0;
  for (int i = count; i > 0; i--) {
    result = result << 8 | bytes_[i];
  }
  return result;
}

std::string Digest::ToString() const {
  std::stringstream s;
  s << std::hex << std::setfill('0');
  for (auto byte : bytes_) {
    s << std::setw(2) << static_cast<int>(byte);
  }
  return s.str();
}

std::ostream &operator<<(std::ostream &out, const Digest &digest) {
  return out << digest.ToString();
}

}  // namespace samplehash

/*
 * 설명: OpenSSL RAND_bytes로 식별자와 균등 인덱스를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_service_test.cpp
 */
#include "collab/random.hpp"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace collab {
namespace {
void FillRandom(unsigned char* data, std::size_t len) {
  if (RAND_bytes(data, static_cast<int>(len)) != 1) {
    throw std::runtime_error("RAND_bytes 실패");
  }
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  FillRandom(buffer.data(), buffer.size());
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::size_t RandomIndex(std::size_t bound) {
  if (bound == 0) {
    throw std::invalid_argument("bound는 0보다 커야 합니다");
  }
  // 모듈로 편향을 피하려고 bound의 배수 구간 밖 값은 버린다.
  const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                              (std::numeric_limits<std::uint64_t>::max() % bound);
  std::uint64_t value = 0;
  do {
    FillRandom(reinterpret_cast<unsigned char*>(&value), sizeof(value));
  } while (value >= limit);
  return static_cast<std::size_t>(value % bound);
}

}  // namespace collab

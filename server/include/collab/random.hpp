/*
 * 설명: OpenSSL CSPRNG 기반 식별자/인덱스 생성을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace collab {

// bytes 길이의 난수를 16진 문자열로 돌려준다. RNG 실패 시 std::runtime_error.
std::string RandomHex(std::size_t bytes);

// [0, bound) 범위의 균등 난수. bound는 0보다 커야 한다.
std::size_t RandomIndex(std::size_t bound);

}  // namespace collab

#pragma once

// ---------------------------------------------------------------------------
// python_analyzer.hpp
//
// 화이트리스트 기반 Python 소스 정적 안전성 분석기.
// 스크립트가 파일/네트워크/프로세스/리플렉션 부작용 없이 실행 가능한지
// 구문 트리만 보고 판정한다.
//
// [설계 원칙]
// - 안전하다고 증명하지 못하면 위반으로 보고한다 (default-closed).
//   모르는 모듈은 위험 모듈이 아니어도 "unknown module" 위반이다.
// - 위반은 발견 순서(소스 순서, 부모 먼저)로 누적하며 중복 제거하지 않는다.
// - 구문 오류는 kind "syntax" 위반 정확히 하나.
//
// [오탐/미탐 트레이드오프]
// - 메서드 이름만으로 판정하므로 사용자 정의 객체의 .read()/.run() 도
//   위반이 된다 (오탐). 반대 방향(미탐)을 줄이는 것이 우선이다.
// - 데이터 흐름을 추적하지 않는다. 안전 모듈의 함수 객체를 다른 이름으로
//   바꿔 부르는 경우는 import 단계에서 이미 걸러진다는 가정에 기댄다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// 분석 대상 파일 크기 상한 (바이트)
inline constexpr std::uintmax_t kMaxPythonFileSize = 100'000;

// ---------------------------------------------------------------------------
// Violation
//   kind: import | builtin | method | reflection | async | io | syntax
// ---------------------------------------------------------------------------
struct Violation {
    std::uint32_t line{0};
    std::uint32_t col{0};
    std::string   kind{};
    std::string   detail{};
};

// ---------------------------------------------------------------------------
// FileVerdict
//   analyze_python_file 결과. safe 가 false 이면 reason 이 사용자에게 표시된다.
// ---------------------------------------------------------------------------
struct FileVerdict {
    bool        safe{false};
    std::string reason{};
};

// analyze_python_source
//   allow_print: print() 호출을 허용할지 (기본 허용)
//   반환: 위반 목록. 비어 있으면 안전.
[[nodiscard]] std::vector<Violation> analyze_python_source(std::string_view source,
                                                           bool allow_print = true);

// analyze_python_file
//   존재/정규 파일/확장자(.py, .pyw)/크기/UTF-8 검사 후 소스 분석.
//   첫 번째 위반을 "<kind>: <detail> (line N)" 형태의 reason 으로 돌려준다.
[[nodiscard]] FileVerdict analyze_python_file(const std::filesystem::path& path);

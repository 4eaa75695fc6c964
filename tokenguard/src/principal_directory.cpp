/*
 * 설명: 메모리 주체 디렉터리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "tokenguard/principal_directory.hpp"

namespace tokenguard {

void InMemoryPrincipalDirectory::SetStaff(UserId user_id, bool staff) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (staff) {
    staff_.insert(user_id);
  } else {
    staff_.erase(user_id);
  }
}

bool InMemoryPrincipalDirectory::IsStaff(UserId user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return staff_.count(user_id) > 0;
}

}  // namespace tokenguard

#pragma once

#include "protocol/messages.hpp"

#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// Authenticator
//   Login 을 받아 접근 허용 여부를 판정하는 외부 협력자.
//   여러 세션에서 동시에 호출될 수 있다.
// ---------------------------------------------------------------------------
class Authenticator {
public:
    virtual ~Authenticator() = default;

    [[nodiscard]] virtual auto authorize(const Login& login) const -> bool = 0;
};

// ---------------------------------------------------------------------------
// UserTableAuthenticator
//   설정에서 읽은 사용자 이름 → 비밀번호 표로 판정한다.
//   생성 후 불변이므로 락 없이 공유할 수 있다.
// ---------------------------------------------------------------------------
class UserTableAuthenticator final : public Authenticator {
public:
    explicit UserTableAuthenticator(std::unordered_map<std::string, std::string> users);

    [[nodiscard]] auto authorize(const Login& login) const -> bool override;

    [[nodiscard]] auto user_count() const noexcept -> std::size_t;

private:
    std::unordered_map<std::string, std::string> users_;
};

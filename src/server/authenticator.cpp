#include "server/authenticator.hpp"

#include <utility>

UserTableAuthenticator::UserTableAuthenticator(std::unordered_map<std::string, std::string> users)
    : users_{std::move(users)}
{}

auto UserTableAuthenticator::authorize(const Login& login) const -> bool
{
    const auto it = users_.find(login.username);
    if (it == users_.end()) {
        return false;
    }
    return it->second == login.password;
}

auto UserTableAuthenticator::user_count() const noexcept -> std::size_t
{
    return users_.size();
}

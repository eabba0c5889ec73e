/// @file credentials.hpp
/// @brief Users, tokens and the credential providers the client consumes.

#pragma once

#include <docsync-cpp/error.hpp>

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace docsync_cpp {

/// The signed-in user, or the unauthenticated user.
///
/// Mutation queues and overlays are kept per user.
class User {
public:
    User() = default;
    explicit User(std::string uid) : uid_{std::move(uid)} {}

    static auto unauthenticated() -> User { return User{}; }

    auto is_authenticated() const -> bool { return uid_.has_value(); }

    /// The uid, or the empty string for the unauthenticated user.
    auto uid() const -> const std::string& {
        static const auto empty = std::string{};
        return uid_ ? *uid_ : empty;
    }

    auto operator<=>(const User&) const = default;
    auto operator==(const User&) const -> bool = default;

private:
    std::optional<std::string> uid_;
};

/// A bearer token and the user it authenticates.
struct AuthToken {
    std::string token;  ///< Empty for the unauthenticated user.
    User user;
};

/// The tokens a stream opens with.
struct StreamTokens {
    AuthToken auth;
    std::string app_check;  ///< Empty if App Check is not configured.
};

/// Supplies bearer tokens. Implementations may call back on any thread.
class CredentialsProvider {
public:
    using TokenCallback = std::function<void(Result<AuthToken>)>;
    using ChangeListener = std::function<void(User)>;

    virtual ~CredentialsProvider() = default;

    /// Fetch the current token.
    virtual void get_token(TokenCallback callback) = 0;

    /// Force the next get_token to refresh.
    virtual void invalidate_token() = 0;

    /// Called with the initial user and again on every user change.
    virtual void set_change_listener(ChangeListener listener) = 0;
};

/// Supplies App Check attestation tokens.
class AppCheckProvider {
public:
    using TokenCallback = std::function<void(Result<std::string>)>;

    virtual ~AppCheckProvider() = default;

    virtual void get_token(TokenCallback callback) = 0;
    virtual void invalidate_token() = 0;
};

/// Always the unauthenticated user with an empty token.
class EmptyCredentialsProvider : public CredentialsProvider {
public:
    void get_token(TokenCallback callback) override { callback(AuthToken{}); }
    void invalidate_token() override {}
    void set_change_listener(ChangeListener listener) override {
        if (listener) listener(User::unauthenticated());
    }
};

/// No App Check: an empty token.
class EmptyAppCheckProvider : public AppCheckProvider {
public:
    void get_token(TokenCallback callback) override { callback(std::string{}); }
    void invalidate_token() override {}
};

}  // namespace docsync_cpp

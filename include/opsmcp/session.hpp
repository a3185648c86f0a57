#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace opsmcp {

enum class SessionState {
    Uninitialized,
    Initialized
};

/// Server-side protocol state of one client, keyed by an opaque token.
/// The state only ever moves Uninitialized -> Initialized.
class Session {
public:
    using Clock = std::chrono::steady_clock;

    explicit Session(std::string id, Clock::time_point now = Clock::now());

    const std::string& id() const { return id_; }

    SessionState state() const;
    bool initialized() const;

    /// Returns true only for the call that performed the transition.
    bool mark_initialized();

    /// Wall-clock creation time, for status reporting.
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    Clock::time_point last_seen() const;
    void touch(Clock::time_point now = Clock::now());

private:
    const std::string id_;
    const std::chrono::system_clock::time_point created_at_;
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    Clock::time_point last_seen_;
};

/// 128 random bits in hex followed by a base36 millisecond timestamp.
std::string generate_session_id();

class SessionStore {
public:
    struct Options {
        // Sessions idle for longer than this are dropped by evict_expired().
        // Zero keeps sessions forever.
        std::chrono::seconds idle_ttl{std::chrono::minutes(30)};
    };

    SessionStore();
    explicit SessionStore(Options opts);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Resolve a session. An absent id gets a freshly generated one; an
    /// unknown id is adopted as-is. Never fails.
    std::shared_ptr<Session> get_or_create(const std::optional<std::string>& id,
                                           Session::Clock::time_point now = Session::Clock::now());

    /// Lookup without creation.
    [[nodiscard]] std::shared_ptr<Session> find(const std::string& id) const;

    /// Remove sessions idle beyond the TTL. Returns the number removed.
    size_t evict_expired(Session::Clock::time_point now = Session::Clock::now());

    [[nodiscard]] size_t size() const;

    const Options& options() const { return opts_; }

private:
    Options opts_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace opsmcp

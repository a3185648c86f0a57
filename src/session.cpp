#include "opsmcp/session.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace opsmcp {

// ---------- Session ----------

Session::Session(std::string id, Clock::time_point now)
    : id_(std::move(id))
    , created_at_(std::chrono::system_clock::now())
    , last_seen_(now) {
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::initialized() const {
    return state() == SessionState::Initialized;
}

bool Session::mark_initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Initialized) return false;
    state_ = SessionState::Initialized;
    return true;
}

Session::Clock::time_point Session::last_seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seen_;
}

void Session::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_seen_ = std::max(last_seen_, now);
}

// ---------- Identifiers ----------

namespace {

std::string to_base36(uint64_t v) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(digits[v % 36]);
        v /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // anonymous namespace

std::string generate_session_id() {
    thread_local std::mt19937_64 gen{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << dis(gen) << std::setw(16) << dis(gen);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return oss.str() + to_base36(static_cast<uint64_t>(ms));
}

// ---------- SessionStore ----------

SessionStore::SessionStore() : SessionStore(Options{}) {}

SessionStore::SessionStore(Options opts) : opts_(opts) {}

std::shared_ptr<Session> SessionStore::get_or_create(const std::optional<std::string>& id,
                                                     Session::Clock::time_point now) {
    std::string key = (id && !id->empty()) ? *id : generate_session_id();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it != sessions_.end()) {
        it->second->touch(now);
        return it->second;
    }
    auto session = std::make_shared<Session>(key, now);
    sessions_.emplace(key, session);
    spdlog::debug("Created session {} ({} active)", key, sessions_.size());
    return session;
}

std::shared_ptr<Session> SessionStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

size_t SessionStore::evict_expired(Session::Clock::time_point now) {
    if (opts_.idle_ttl.count() <= 0) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (now - it->second->last_seen() > opts_.idle_ttl) {
            spdlog::debug("Evicting idle session {}", it->first);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::info("Evicted {} idle session(s), {} remaining", removed, sessions_.size());
    }
    return removed;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace opsmcp

#pragma once

#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <cstddef>
#include <algorithm>
#include <exception>
#include <utility>

#include "wiredive/core/config/session.hpp"
#include "wiredive/core/session/config.hpp"
#include "wiredive/core/session/session.hpp"
#include "wiredive/core/transport/websocket_concept.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::core::session {

/*
===============================================================================
 wiredive::core::session::Pool
===============================================================================

Bounded set of Sessions against one Endpoint.

  lease()        Reuse an idle, alive, non-stale session, otherwise open a
                 new one while capacity remains, otherwise return nullptr.
                 Pool exhaustion is not an error: the caller falls back to
                 a direct, unpooled Session.
  release(s)     Mark the entry idle and stamp last-used. A session that
                 is no longer alive is evicted instead. Unknown sessions
                 are logged and ignored.
  sweep_expired  Evict and close idle entries idle for longer than the TTL.
  close_all      Close every managed session (process shutdown).

Every mutation happens under one mutex, including the open of a new
session, so the capacity bound holds at all times and two callers can never
lease the same idle session.

Sessions are owned by the pool; lease() hands out a non-owning pointer that
stays valid until the matching release() (or close_all()).
===============================================================================
*/

struct PoolConfig {
    std::size_t               capacity = config::session::POOL_CAPACITY;
    std::chrono::milliseconds idle_ttl = config::session::POOL_IDLE_TTL;
    OpenPolicy                open{};
};

template <transport::WebSocketConcept WS>
class Pool {
public:
    using clock = std::chrono::steady_clock;
    using session_type = Session<WS>;

    Pool(Endpoint endpoint, const PoolConfig& cfg, lcr::log::Logger& log)
        : endpoint_(std::move(endpoint))
        , cfg_(cfg)
        , log_(log)
    {}

    ~Pool() {
        close_all();
    }

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    [[nodiscard]]
    session_type* lease() noexcept {
        bool exhausted = false;
        return lease(exhausted);
    }

    // `exhausted` tells a full pool apart from a failed open
    [[nodiscard]]
    session_type* lease(bool& exhausted) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        exhausted = false;
        const auto now = clock::now();

        // 1) Reuse an idle session, evicting stale or dead ones on the way
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->in_use) {
                ++it;
                continue;
            }
            const bool alive = it->session->is_alive();
            const bool fresh = (now - it->last_used_at) < cfg_.idle_ttl;
            if (alive && fresh) {
                it->in_use = true;
                it->last_used_at = now;
                WD_DEBUG(log_, "[POOL] Reusing session #" << it->session->id());
                return it->session.get();
            }
            WD_INFO(log_, "[POOL] Evicting session #" << it->session->id() << (alive ? " (idle TTL exceeded)" : " (not alive)"));
            it->session->close();
            it = entries_.erase(it);
        }

        // 2) Open a new one while capacity remains
        if (entries_.size() >= cfg_.capacity) {
            WD_WARN(log_, "[POOL] Exhausted (" << entries_.size() << "/" << cfg_.capacity << " in use)");
            exhausted = true;
            return nullptr;
        }

        try {
            auto session = std::make_unique<session_type>(endpoint_, log_);
            if (session->open(cfg_.open) != transport::Error::None) {
                WD_ERROR(log_, "[POOL] Could not open a new session");
                return nullptr;
            }
            entries_.push_back(PooledConnection{std::move(session), true, now, clock::now()});
            WD_INFO(log_, "[POOL] Opened session #" << entries_.back().session->id()
                          << " (" << entries_.size() << "/" << cfg_.capacity << ")");
            return entries_.back().session.get();
        }
        catch (const std::exception& e) {
            WD_ERROR(log_, "[POOL] lease() failed: " << e.what());
            return nullptr;
        }
    }

    void release(const session_type* session) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_(session);
        if (it == entries_.end()) {
            WD_WARN(log_, "[POOL] release() of an unknown session ignored");
            return;
        }
        if (!it->session->is_alive()) {
            WD_INFO(log_, "[POOL] Dropping released session #" << it->session->id() << " (not alive)");
            it->session->close();
            entries_.erase(it);
            return;
        }
        it->in_use = false;
        it->last_used_at = clock::now();
        WD_DEBUG(log_, "[POOL] Released session #" << it->session->id());
    }

    // Returns the number of evicted sessions
    std::size_t sweep_expired() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();
        std::size_t evicted = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (!it->in_use && (now - it->last_used_at) >= cfg_.idle_ttl) {
                WD_INFO(log_, "[POOL] Expired session #" << it->session->id());
                it->session->close();
                it = entries_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
        return evicted;
    }

    void close_all() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.empty()) {
            return;
        }
        for (auto& entry : entries_) {
            entry.session->close();
        }
        WD_INFO(log_, "[POOL] Closed " << entries_.size() << " session(s)");
        entries_.clear();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]]
    std::size_t in_use() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                      [](const PooledConnection& e) { return e.in_use; }));
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return cfg_.capacity; }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const OpenPolicy& open_policy() const noexcept { return cfg_.open; }
    [[nodiscard]] lcr::log::Logger& logger() const noexcept { return log_; }

private:
    struct PooledConnection {
        std::unique_ptr<session_type> session;
        bool in_use = false;
        clock::time_point created_at;
        clock::time_point last_used_at;
    };

    [[nodiscard]]
    typename std::vector<PooledConnection>::iterator find_(const session_type* session) noexcept {
        return std::find_if(entries_.begin(), entries_.end(),
                            [session](const PooledConnection& e) { return e.session.get() == session; });
    }

private:
    const Endpoint endpoint_;
    const PoolConfig cfg_;
    lcr::log::Logger& log_;

    mutable std::mutex mutex_;
    std::vector<PooledConnection> entries_;
};

// -----------------------------------------------------------------------------
// Lease
// -----------------------------------------------------------------------------
//
// Scoped ownership of one Session: a pooled lease when the pool has room,
// otherwise (pool exhausted) a direct session opened with the pool's
// endpoint and policy. A failed open is not retried here.
// The pooled session is released (or the direct one closed) on destruction.
// -----------------------------------------------------------------------------
template <transport::WebSocketConcept WS>
class Lease {
public:
    explicit Lease(Pool<WS>& pool) noexcept
        : pool_(pool)
    {
        bool exhausted = false;
        pooled_ = pool_.lease(exhausted);
        if (pooled_ || !exhausted) {
            return;
        }
        WD_WARN(pool_.logger(), "[POOL] No pooled session available, opening a direct session");
        try {
            direct_ = std::make_unique<Session<WS>>(pool_.endpoint(), pool_.logger());
            if (direct_->open(pool_.open_policy()) != transport::Error::None) {
                direct_.reset();
            }
        } catch (const std::exception& e) {
            WD_ERROR(pool_.logger(), "[POOL] Direct session failed: " << e.what());
            direct_.reset();
        }
    }

    ~Lease() {
        if (pooled_) {
            pool_.release(pooled_);
        }
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    [[nodiscard]]
    Session<WS>* get() noexcept {
        return pooled_ ? pooled_ : direct_.get();
    }

    [[nodiscard]] bool pooled() const noexcept { return pooled_ != nullptr; }

    explicit operator bool() const noexcept { return pooled_ != nullptr || direct_ != nullptr; }

private:
    Pool<WS>& pool_;
    Session<WS>* pooled_ = nullptr;
    std::unique_ptr<Session<WS>> direct_;
};

} // namespace wiredive::core::session

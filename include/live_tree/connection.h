// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file connection.h
/// @brief Subscription handles returned by observe_deep() and friends.
///
/// A Connection does NOT disconnect on destruction; wrap it in a
/// ScopedConnection (or a ScopedConnectionList) for RAII teardown.

#pragma once

#include <live_tree/api.h>

#include <functional>
#include <utility>
#include <vector>

namespace live_tree {

class Connection {
public:
    using Disconnector = std::function<void()>;

    Connection() noexcept = default;
    explicit Connection(Disconnector disconnector) noexcept;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection() = default;

    /// @brief Disconnect this subscription (idempotent)
    void disconnect();

    [[nodiscard]] bool connected() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept { return connected(); }

private:
    Disconnector disconnector_;
};

/// @brief RAII wrapper for Connection - auto-disconnects on destruction
class ScopedConnection {
public:
    ScopedConnection() noexcept = default;
    ScopedConnection(Connection conn) noexcept;
    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void reset();
    [[nodiscard]] Connection release() noexcept;
    [[nodiscard]] bool connected() const noexcept { return conn_.connected(); }

private:
    Connection conn_;
};

/// @brief Container for multiple scoped connections
class ScopedConnectionList {
public:
    ScopedConnectionList() = default;
    ScopedConnectionList(ScopedConnectionList&&) = default;
    ScopedConnectionList& operator=(ScopedConnectionList&&) = default;

    void add(Connection conn) { connections_.emplace_back(std::move(conn)); }
    void clear() { connections_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return connections_.size(); }

private:
    std::vector<ScopedConnection> connections_;
};

// ============================================================
// Inline implementations
// ============================================================

inline Connection::Connection(Disconnector disconnector) noexcept
    : disconnector_(std::move(disconnector)) {}

inline Connection::Connection(Connection&& other) noexcept
    : disconnector_(std::exchange(other.disconnector_, nullptr)) {}

inline Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        disconnector_ = std::exchange(other.disconnector_, nullptr);
    }
    return *this;
}

inline void Connection::disconnect() {
    if (auto fn = std::exchange(disconnector_, nullptr)) {
        fn();
    }
}

inline bool Connection::connected() const noexcept {
    return static_cast<bool>(disconnector_);
}

inline ScopedConnection::ScopedConnection(Connection conn) noexcept : conn_(std::move(conn)) {}

inline ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        conn_.disconnect();
        conn_ = std::move(other.conn_);
    }
    return *this;
}

inline ScopedConnection::~ScopedConnection() {
    conn_.disconnect();
}

inline void ScopedConnection::reset() {
    conn_.disconnect();
}

inline Connection ScopedConnection::release() noexcept {
    return std::move(conn_);
}

} // namespace live_tree

#pragma once

#include <QMetaObject>
#include <QObject>

#include <functional>
#include <utility>
#include <vector>

namespace cutline {

/**
 * Disposer: runs a teardown action exactly once, at dispose() or destruction.
 * Every listener, timer or event filter acquired by a component is paired
 * with one of these.
 */
class Disposer
{
public:
    Disposer() = default;
    explicit Disposer(std::function<void()> teardown) : m_teardown(std::move(teardown)) {}
    ~Disposer() { dispose(); }

    Disposer(const Disposer&) = delete;
    Disposer& operator=(const Disposer&) = delete;

    Disposer(Disposer&& other) noexcept : m_teardown(std::move(other.m_teardown)) {
        other.m_teardown = nullptr;
    }
    Disposer& operator=(Disposer&& other) noexcept {
        if (this != &other) {
            dispose();
            m_teardown = std::move(other.m_teardown);
            other.m_teardown = nullptr;
        }
        return *this;
    }

    void dispose() {
        if (m_teardown) {
            auto teardown = std::move(m_teardown);
            m_teardown = nullptr;
            teardown();
        }
    }

    bool isActive() const { return static_cast<bool>(m_teardown); }

    static Disposer forConnection(const QMetaObject::Connection& connection) {
        return Disposer([connection]() { QObject::disconnect(connection); });
    }

private:
    std::function<void()> m_teardown;
};

// Owns a set of disposers; disposes in reverse acquisition order
class DisposerBag
{
public:
    DisposerBag() = default;
    ~DisposerBag() { disposeAll(); }

    DisposerBag(const DisposerBag&) = delete;
    DisposerBag& operator=(const DisposerBag&) = delete;

    void add(Disposer disposer) { m_disposers.push_back(std::move(disposer)); }
    void add(const QMetaObject::Connection& connection) {
        m_disposers.push_back(Disposer::forConnection(connection));
    }

    void disposeAll() {
        while (!m_disposers.empty()) {
            m_disposers.back().dispose();
            m_disposers.pop_back();
        }
    }

    std::size_t size() const { return m_disposers.size(); }

private:
    std::vector<Disposer> m_disposers;
};

} // namespace cutline

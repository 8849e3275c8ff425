#pragma once

#include <functional>
#include <memory>

#include <QDeadlineTimer>
#include <QHash>
#include <QList>
#include <QString>

namespace oasis::control {

// Keyed cache with a time-to-live per entry and at most one refresh in
// flight per key. Callers arriving while a key is being refreshed queue
// behind it in order; when the refresh completes each queued caller checks
// the entry again and only fetches itself if it is still stale.
//
// Result must be copyable and provide ok(); only successful results are
// stored, failures go back to the caller that fetched them. A ttl <= 0
// never stores.
template <typename Result>
class MetadataCache
{
public:
    using Done = std::function<void(const Result &result)>;
    // Performs the refresh and calls the supplied Done exactly once.
    using Fetch = std::function<void(Done done)>;

    MetadataCache() = default;
    MetadataCache(const MetadataCache &) = delete;
    MetadataCache &operator=(const MetadataCache &) = delete;

    // done may run before get() returns when the entry is fresh.
    void get(const QString &key, qint64 ttlMs, Fetch fetch, Done done)
    {
        if (const Result *cached = fresh(key)) {
            const Result copy = *cached;
            done(copy);
            return;
        }

        Slot &slot = m_slots[key];
        slot.waiters.append(Waiter{ttlMs, std::move(fetch), std::move(done)});
        if (!slot.busy)
            pump(key);
    }

    // Fresh entry for key, if any.
    const Result *fresh(const QString &key) const
    {
        const auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd() || it->expiry.hasExpired())
            return nullptr;
        return &it->value;
    }

    bool isRefreshing(const QString &key) const
    {
        const auto it = m_slots.constFind(key);
        return it != m_slots.constEnd() && it->busy;
    }

    void invalidate(const QString &key) { m_entries.remove(key); }

    // Drops every entry. Refreshes already in flight still answer their
    // callers but no longer store their result.
    void clear()
    {
        m_entries.clear();
        ++m_epoch;
    }

private:
    struct Entry {
        Result value;
        QDeadlineTimer expiry;
    };

    struct Waiter {
        qint64 ttlMs = 0;
        Fetch fetch;
        Done done;
    };

    struct Slot {
        bool busy = false;
        QList<Waiter> waiters;
    };

    void pump(const QString &key)
    {
        const std::weak_ptr<int> alive = m_alive;
        for (;;) {
            auto it = m_slots.find(key);
            if (it == m_slots.end())
                return;
            if (it->waiters.isEmpty()) {
                if (!it->busy)
                    m_slots.erase(it);
                return;
            }

            Waiter waiter = it->waiters.takeFirst();
            if (const Result *cached = fresh(key)) {
                const Result copy = *cached;
                waiter.done(copy);
                if (alive.expired())
                    return;
                continue;
            }

            it->busy = true;
            const quint64 epoch = m_epoch;
            const qint64 ttlMs = waiter.ttlMs;
            Done done = std::move(waiter.done);
            waiter.fetch([this, alive, key, epoch, ttlMs, done](const Result &result) {
                if (alive.expired()) {
                    done(result);
                    return;
                }
                if (result.ok() && epoch == m_epoch && ttlMs > 0)
                    m_entries.insert(key, Entry{result, QDeadlineTimer(ttlMs)});
                auto slot = m_slots.find(key);
                if (slot != m_slots.end())
                    slot->busy = false;
                done(result);
                if (!alive.expired())
                    pump(key);
            });
            return;
        }
    }

    QHash<QString, Entry> m_entries;
    QHash<QString, Slot> m_slots;
    quint64 m_epoch = 0;
    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

} // namespace oasis::control

/*
 * queue_test.cpp
 *
 * Contract test for bulkq::queue<T>, driven only through the abstract
 * interface (queue<T>&). Every variant must pass it unchanged.
 *
 * Goals:
 *  - Pin the signatures of the capability at compile time.
 *  - Accounting: amount_queued() + amount_free() == capacity() after every op.
 *  - Full/empty boundaries of enqueue/dequeue.
 *  - FIFO conservation, bulk/single equivalence, window bounds.
 *  - Bulk helpers (bulk_enqueue/bulk_dequeue) stop at one window.
 */

#include <QtTest/QtTest>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <type_traits>
#include <utility>
#include <vector>

#include "queue_test.h"
#include "bulkq/fixed.hpp"

namespace {

using IntQueue = bulkq::queue<int>;

#if defined(NDEBUG)
static constexpr int kRandomOps = 40'000;
#else
static constexpr int kRandomOps = 6'000;
#endif

// ------------------------------ compile-time API smoke ------------------------------

template <class Q>
static void api_smoke_compile() {
    using value_type = typename Q::value_type;
    using size_type = typename Q::size_type;
    using window = typename Q::window;

    static_assert(std::is_abstract_v<Q>);
    static_assert(std::has_virtual_destructor_v<Q>);
    static_assert(std::is_same_v<size_type, reg>);

    static_assert(std::is_same_v<decltype(std::declval<const Q&>().amount_queued()), size_type>);
    static_assert(std::is_same_v<decltype(std::declval<const Q&>().amount_free()), size_type>);
    static_assert(std::is_same_v<decltype(std::declval<const Q&>().capacity()), size_type>);
    static_assert(std::is_same_v<decltype(std::declval<const Q&>().is_empty()), bool>);
    static_assert(std::is_same_v<decltype(std::declval<const Q&>().is_full()), bool>);

    static_assert(std::is_same_v<decltype(std::declval<Q&>().enqueue(std::declval<value_type>())), bool>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().dequeue()), std::optional<value_type>>);

    static_assert(std::is_same_v<decltype(std::declval<Q&>().expose_writable_slots()), window>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().commit_written(size_type{1})), void>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().expose_readable_slots()), window>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().consume_read(size_type{1})), void>);

    static_assert(noexcept(std::declval<Q&>().expose_writable_slots()));
    static_assert(noexcept(std::declval<Q&>().commit_written(size_type{1})));
    static_assert(noexcept(std::declval<Q&>().expose_readable_slots()));
    static_assert(noexcept(std::declval<Q&>().consume_read(size_type{1})));

    static_assert(std::is_same_v<decltype(std::declval<Q&>().bulk_enqueue(
                      std::declval<const value_type*>(), size_type{1})), size_type>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().bulk_dequeue(
                      std::declval<value_type*>(), size_type{1})), size_type>);

    static_assert(std::is_same_v<decltype(std::declval<Q&>().bulk_dequeue_uninit(
                      std::declval<value_type*>(), size_type{1})), size_type>);

    static_assert(std::is_same_v<decltype(std::declval<window&>().ptr), value_type*>);
    static_assert(std::is_same_v<decltype(std::declval<window&>().count), size_type>);
    static_assert(std::is_same_v<decltype(std::declval<const window&>().empty()), bool>);
}

// The capability itself puts no requirement on T beyond being an object type;
// default construction is a requirement of fixed<T> only.
struct NoDefault final {
    explicit NoDefault(int x) noexcept : v(x) {}
    int v;
};

static_assert(!std::is_default_constructible_v<NoDefault>);

// ------------------------------ helpers ------------------------------

static std::unique_ptr<IntQueue> make_fixed(const reg capacity) {
    return std::make_unique<bulkq::fixed<int>>(capacity);
}

static void verify_accounting(const IntQueue& q, const reg capacity) {
    QCOMPARE(q.capacity(), capacity);
    QCOMPARE(q.amount_queued() + q.amount_free(), capacity);
    QVERIFY(q.amount_queued() <= capacity);
    QCOMPARE(q.is_empty(), q.amount_queued() == 0u);
    QCOMPARE(q.is_full(), q.amount_free() == 0u);
}

static void verify_window_bounds(IntQueue& q) {
    const auto w = q.expose_writable_slots();
    QVERIFY(w.count <= q.amount_free());
    QCOMPARE(w.empty(), q.amount_free() == 0u);

    const auto r = q.expose_readable_slots();
    QVERIFY(r.count <= q.amount_queued());
    QCOMPARE(r.empty(), q.amount_queued() == 0u);
}

// Writes items through expose/commit, looping across the physical end.
static reg bulk_write_all(IntQueue& q, const std::vector<int>& items) {
    reg done = 0u;
    while (done < items.size()) {
        const auto w = q.expose_writable_slots();
        if (w.empty()) {
            break;
        }
        reg n = 0u;
        while (n < w.count && done < items.size()) {
            w.ptr[n++] = items[done++];
        }
        q.commit_written(n);
    }
    return done;
}

// Reads everything through expose/consume, looping across the physical end.
static std::vector<int> bulk_read_all(IntQueue& q) {
    std::vector<int> out;
    for (;;) {
        const auto r = q.expose_readable_slots();
        if (r.empty()) {
            break;
        }
        for (const int v : r) {
            out.push_back(v);
        }
        q.consume_read(r.count);
    }
    return out;
}

static std::vector<int> drain(IntQueue& q) {
    std::vector<int> out;
    while (auto v = q.dequeue()) {
        out.push_back(*v);
    }
    return out;
}

// ------------------------------ suites ------------------------------

static void run_accounting_suite(const reg capacity) {
    auto q = make_fixed(capacity);
    verify_accounting(*q, capacity);
    QVERIFY(q->is_empty());

    for (reg i = 0; i < capacity; ++i) {
        QCOMPARE(q->amount_free(), static_cast<reg>(capacity - i));
        QVERIFY(q->enqueue(static_cast<int>(i)));
        verify_accounting(*q, capacity);
    }
    QVERIFY(q->is_full());

    for (reg i = 0; i < capacity; ++i) {
        QVERIFY(q->dequeue().has_value());
        verify_accounting(*q, capacity);
    }
    QVERIFY(q->is_empty());
}

static void run_boundary_suite(const reg capacity) {
    auto q = make_fixed(capacity);

    // dequeue on empty: absent, no change
    QVERIFY(!q->dequeue().has_value());
    QCOMPARE(q->amount_queued(), reg{0});

    for (reg i = 0; i < capacity; ++i) {
        QVERIFY(q->enqueue(100 + static_cast<int>(i)));
    }

    // enqueue on full: false, no change
    QCOMPARE(q->amount_free(), reg{0});
    QVERIFY(!q->enqueue(-1));
    QCOMPARE(q->amount_queued(), capacity);

    // the rejected item never shows up
    const std::vector<int> got = drain(*q);
    QCOMPARE(static_cast<reg>(got.size()), capacity);
    for (reg i = 0; i < capacity; ++i) {
        QCOMPARE(got[i], 100 + static_cast<int>(i));
    }
    QVERIFY(!q->dequeue().has_value());
}

static void run_fifo_conservation(const reg capacity) {
    auto q = make_fixed(capacity);

    // N enqueues then N dequeues, several rounds to move the cursors around
    int next = 0;
    for (int round = 0; round < 5; ++round) {
        const reg n = static_cast<reg>((round % 2 == 0) ? capacity : (capacity + 1u) / 2u);
        std::vector<int> in;
        for (reg i = 0; i < n; ++i) {
            in.push_back(next);
            QVERIFY(q->enqueue(next++));
        }
        QCOMPARE(drain(*q), in);
    }
}

static void run_bulk_single_equivalence(const reg capacity) {
    auto single = make_fixed(capacity);
    auto bulk = make_fixed(capacity);

    // Offset both queues identically so the bulk writes straddle the end.
    const reg offset = capacity / 2u;
    for (reg i = 0; i < offset; ++i) {
        QVERIFY(single->enqueue(-1));
        QVERIFY(bulk->enqueue(-1));
    }
    for (reg i = 0; i < offset; ++i) {
        QVERIFY(single->dequeue().has_value());
        QVERIFY(bulk->dequeue().has_value());
    }

    std::vector<int> items;
    for (reg i = 0; i < capacity; ++i) {
        items.push_back(7 * static_cast<int>(i) + 3);
    }

    for (const int v : items) {
        QVERIFY(single->enqueue(v));
    }
    QCOMPARE(bulk_write_all(*bulk, items), static_cast<reg>(items.size()));

    QCOMPARE(bulk->amount_queued(), single->amount_queued());
    QCOMPARE(bulk->amount_free(), single->amount_free());

    // Cross the read styles too: single reads of the bulk queue and vice versa.
    const std::vector<int> a = drain(*bulk);
    const std::vector<int> b = bulk_read_all(*single);
    QCOMPARE(a, items);
    QCOMPARE(b, items);
}

static void run_noop_commit_consume(const reg capacity) {
    auto q = make_fixed(capacity);

    q->commit_written(0u);
    q->consume_read(0u);
    verify_accounting(*q, capacity);
    QVERIFY(q->is_empty());

    QVERIFY(q->enqueue(1));
    if (capacity > 1u) {
        QVERIFY(q->enqueue(2));
    }
    const reg queued = q->amount_queued();
    const reg free_slots = q->amount_free();

    (void)q->expose_writable_slots();
    q->commit_written(0u);
    (void)q->expose_readable_slots();
    q->consume_read(0u);

    QCOMPARE(q->amount_queued(), queued);
    QCOMPARE(q->amount_free(), free_slots);
    QCOMPARE(*q->dequeue(), 1);
    if (capacity > 1u) {
        QCOMPARE(*q->dequeue(), 2);
    }
    QVERIFY(q->is_empty());
}

static void run_bulk_helpers(const reg capacity) {
    auto q = make_fixed(capacity);

    std::vector<int> src;
    for (reg i = 0; i < capacity + 3u; ++i) {
        src.push_back(static_cast<int>(i) + 1);
    }

    // empty source / empty destination
    QCOMPARE(q->bulk_enqueue(src.data(), reg{0}), reg{0});
    std::vector<int> dst(capacity + 3u, 0);
    QCOMPARE(q->bulk_dequeue(dst.data(), reg{4}), reg{0});

    // a fresh queue exposes the whole store in one window
    QCOMPARE(q->bulk_enqueue(src.data(), static_cast<reg>(src.size())), capacity);
    QVERIFY(q->is_full());
    QCOMPARE(q->bulk_enqueue(src.data(), reg{1}), reg{0});

    if (capacity < 2u) {
        // a single slot never splits: read and write cursors stay at 0
        QCOMPARE(q->bulk_dequeue(dst.data(), reg{3}), reg{1});
        QCOMPARE(dst[0], 1);
        return;
    }

    const reg first = q->bulk_dequeue(dst.data(), reg{1});
    QCOMPARE(first, reg{1});
    QCOMPARE(dst[0], 1);

    // one free slot at the physical start: exactly one item goes in
    QCOMPARE(q->bulk_enqueue(src.data() + capacity, reg{3}), reg{1});
    QVERIFY(q->is_full());

    // readable window ends at the physical end: capacity - 1 items, then the wrapped one
    const reg second = q->bulk_dequeue(dst.data(), static_cast<reg>(dst.size()));
    QCOMPARE(second, static_cast<reg>(capacity - 1u));
    for (reg i = 0; i < second; ++i) {
        QCOMPARE(dst[i], static_cast<int>(i) + 2);
    }
    QCOMPARE(q->bulk_dequeue(dst.data(), static_cast<reg>(dst.size())), reg{1});
    QCOMPARE(dst[0], static_cast<int>(capacity) + 1);
    QVERIFY(q->is_empty());

#if BULKQ_HAS_SPAN
    // cursors now sit at slot 1: the writable window ends capacity - 1 slots later
    const std::vector<int> three{10, 20, 30};
    const reg expected = std::min<reg>(reg{3}, static_cast<reg>(capacity - 1u));
    QCOMPARE(q->bulk_enqueue(std::span<const int>(three)), expected);
    std::vector<int> out(3, 0);
    QCOMPARE(q->bulk_dequeue(std::span<int>(out)), expected);
    QCOMPARE(out[0], 10);
#endif /* BULKQ_HAS_SPAN */
}

static void run_random_against_model(const reg capacity, const std::uint32_t seed) {
    auto q = make_fixed(capacity);
    std::deque<int> model;
    std::mt19937 rng(seed);
    int next = 0;

    for (int step = 0; step < kRandomOps; ++step) {
        const unsigned op = rng() % 6u;
        switch (op) {
        case 0: {
            const bool ok = q->enqueue(next);
            QCOMPARE(ok, model.size() < capacity);
            if (ok) {
                model.push_back(next);
            }
            ++next;
            break;
        }
        case 1: {
            const std::optional<int> v = q->dequeue();
            QCOMPARE(v.has_value(), !model.empty());
            if (v) {
                QCOMPARE(*v, model.front());
                model.pop_front();
            }
            break;
        }
        case 2: {
            const auto w = q->expose_writable_slots();
            const reg n = w.count == 0u ? 0u : static_cast<reg>(rng() % (w.count + 1u));
            for (reg i = 0; i < n; ++i) {
                w.ptr[i] = next;
                model.push_back(next++);
            }
            q->commit_written(n);
            break;
        }
        case 3: {
            const auto r = q->expose_readable_slots();
            const reg n = r.count == 0u ? 0u : static_cast<reg>(rng() % (r.count + 1u));
            for (reg i = 0; i < n; ++i) {
                QCOMPARE(r.ptr[i], model.front());
                model.pop_front();
            }
            q->consume_read(n);
            break;
        }
        case 4: {
            std::vector<int> src(rng() % (capacity + 2u));
            for (int& v : src) {
                v = next++;
            }
            const reg n = q->bulk_enqueue(src.data(), static_cast<reg>(src.size()));
            QVERIFY(n <= src.size());
            for (reg i = 0; i < n; ++i) {
                model.push_back(src[i]);
            }
            break;
        }
        default: {
            std::vector<int> dst(rng() % (capacity + 2u));
            const reg n = q->bulk_dequeue(dst.data(), static_cast<reg>(dst.size()));
            QVERIFY(n <= dst.size());
            for (reg i = 0; i < n; ++i) {
                QCOMPARE(dst[i], model.front());
                model.pop_front();
            }
            break;
        }
        }

        QCOMPARE(q->amount_queued(), static_cast<reg>(model.size()));
        verify_accounting(*q, capacity);
        verify_window_bounds(*q);
    }
}

static constexpr reg kCapacities[] = {1u, 2u, 3u, 4u, 7u, 16u, 33u};

} // namespace

class tst_queue_contract final : public QObject {
    Q_OBJECT
private slots:
    void api_smoke() {
        api_smoke_compile<bulkq::queue<int>>();
        api_smoke_compile<bulkq::queue<std::uint8_t>>();
        api_smoke_compile<bulkq::queue<std::vector<int>>>();
        api_smoke_compile<bulkq::queue<NoDefault>>();
    }

    void accounting() {
        for (const reg cap : kCapacities) {
            run_accounting_suite(cap);
        }
    }

    void full_empty_boundary() {
        for (const reg cap : kCapacities) {
            run_boundary_suite(cap);
        }
    }

    void fifo_conservation() {
        for (const reg cap : kCapacities) {
            run_fifo_conservation(cap);
        }
    }

    void bulk_single_equivalence() {
        for (const reg cap : kCapacities) {
            run_bulk_single_equivalence(cap);
        }
    }

    void noop_commit_consume() {
        for (const reg cap : kCapacities) {
            run_noop_commit_consume(cap);
        }
    }

    void bulk_helpers_one_window() {
        for (const reg cap : kCapacities) {
            run_bulk_helpers(cap);
        }
    }

    void random_ops_against_model() {
        std::uint32_t seed = 0xB01Cu;
        for (const reg cap : kCapacities) {
            run_random_against_model(cap, seed++);
        }
    }

    void window_bounds_on_fresh_queue() {
        auto q = make_fixed(5u);
        verify_window_bounds(*q);

        const auto w = q->expose_writable_slots();
        QCOMPARE(w.count, reg{5});
        QVERIFY(q->expose_readable_slots().empty());
    }
};

int run_tst_queue_contract(int argc, char** argv) {
    tst_queue_contract tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "queue_test.moc"

#pragma once
// Linear space variant of Myers' "An O(ND) Difference Algorithm and Its
// Variations". Works over any random access sequences.
// Adapted from Kakoune's src/diff.hh (Maxime Coste, UNLICENSE).

#include <algorithm>
#include <functional>
#include <memory>

namespace jdv {

enum class DiffOp { Keep, Add, Remove };

namespace detail {

// An edit followed by a (possibly empty) diagonal (x,y) -> (u,v).
struct Snake {
    int x, y, u, v;
    enum Op { Add, Del, RevAdd, RevDel } op;
};

template<bool Forward, typename SeqA, typename SeqB, typename Equal>
Snake furthestSnake(SeqA a, int n, SeqB b, int m,
                    const int* V, int d, int k, Equal eq) {
    const bool add = k == -d || (k != d && V[k - 1] < V[k + 1]);
    const int x = add ? V[k + 1] : V[k - 1] + 1;
    const int y = x - k;

    auto at = [](auto&& base, int i, int size) -> decltype(auto) {
        return Forward ? base[i] : base[size - 1 - i];
    };

    int u = x, v = y;
    while (u < n && v < m && eq(at(a, u, n), at(b, v, m)))
        ++u, ++v;
    return {x, y, u, v, add ? Snake::Add : Snake::Del};
}

template<typename SeqA, typename SeqB, typename Equal>
Snake middleSnake(SeqA a, int n, SeqB b, int m,
                  int* V1, int* V2, int costLimit, Equal eq) {
    const int delta = n - m;
    V1[1] = 0;
    V2[1] = 0;

    const int maxD = std::min((m + n + 1) / 2 + 1, costLimit);
    for (int d = 0; d < maxD; ++d) {
        for (int k1 = -d; k1 <= d; k1 += 2) {
            Snake p = furthestSnake<true>(a, n, b, m, V1, d, k1, eq);
            V1[k1] = p.u;
            const int k2 = -(k1 - delta);
            if ((delta % 2 != 0) && -(d - 1) <= k2 && k2 <= (d - 1) && V1[k1] + V2[k2] >= n)
                return p;
        }
        for (int k2 = -d; k2 <= d; k2 += 2) {
            Snake p = furthestSnake<false>(a, n, b, m, V2, d, k2, eq);
            V2[k2] = p.u;
            const int k1 = -(k2 - delta);
            if ((delta % 2 == 0) && -d <= k1 && k1 <= d && V1[k1] + V2[k2] >= n)
                return {n - p.u, m - p.v, n - p.x, m - p.y,
                        static_cast<Snake::Op>(p.op + Snake::RevAdd)};
        }
    }

    // Cost limit hit: take the furthest reaching snake of one more round.
    Snake best{};
    auto score = [](const Snake& s) { return s.u + s.v; };
    for (int k1 = -maxD; k1 <= maxD; k1 += 2) {
        Snake p = furthestSnake<true>(a, n, b, m, V1, maxD, k1, eq);
        V1[k1] = p.u;
        if ((delta % 2 != 0) && p.u <= n && p.v <= m && score(p) >= score(best))
            best = p;
    }
    for (int k2 = -maxD; k2 <= maxD; k2 += 2) {
        Snake p = furthestSnake<false>(a, n, b, m, V2, maxD, k2, eq);
        V2[k2] = p.u;
        if ((delta % 2 == 0) && p.u <= n && p.v <= m && score(p) >= score(best))
            best = {p.x, p.y, p.u, p.v, static_cast<Snake::Op>(p.op + Snake::RevAdd)};
    }
    if (best.op >= Snake::RevAdd)
        best = {n - best.u, m - best.v, n - best.x, m - best.y, best.op};
    return best;
}

template<typename SeqA, typename SeqB, typename Equal, typename Emit>
void diffRange(SeqA a, int begA, int endA, SeqB b, int begB, int endB,
               int* V1, int* V2, int costLimit, Equal eq, Emit&& emit) {
    auto emitNonEmpty = [&](DiffOp op, int len) {
        if (len != 0) emit(op, len);
    };

    int prefix = 0;
    while (begA != endA && begB != endB && eq(a[begA], b[begB]))
        ++begA, ++begB, ++prefix;

    int suffix = 0;
    while (begA != endA && begB != endB && eq(a[endA - 1], b[endB - 1]))
        --endA, --endB, ++suffix;

    emitNonEmpty(DiffOp::Keep, prefix);

    const int lenA = endA - begA, lenB = endB - begB;
    if (lenA == 0) {
        emitNonEmpty(DiffOp::Add, lenB);
    } else if (lenB == 0) {
        emitNonEmpty(DiffOp::Remove, lenA);
    } else {
        Snake s = middleSnake(a + begA, lenA, b + begB, lenB, V1, V2, costLimit, eq);

        diffRange(a, begA, begA + s.x - int(s.op == Snake::Del),
                  b, begB, begB + s.y - int(s.op == Snake::Add),
                  V1, V2, costLimit, eq, emit);

        if (s.op == Snake::Add) emitNonEmpty(DiffOp::Add, 1);
        if (s.op == Snake::Del) emitNonEmpty(DiffOp::Remove, 1);
        emitNonEmpty(DiffOp::Keep, s.u - s.x);
        if (s.op == Snake::RevAdd) emitNonEmpty(DiffOp::Add, 1);
        if (s.op == Snake::RevDel) emitNonEmpty(DiffOp::Remove, 1);

        diffRange(a, begA + s.u + int(s.op == Snake::RevDel), endA,
                  b, begB + s.v + int(s.op == Snake::RevAdd), endB,
                  V1, V2, costLimit, eq, emit);
    }

    emitNonEmpty(DiffOp::Keep, suffix);
}

} // namespace detail

// Calls onDiff(op, len) for each maximal run of kept, added or removed
// elements turning a[0..n) into b[0..m). Adjacent runs never share an op.
template<typename SeqA, typename SeqB, typename OnDiff, typename Equal = std::equal_to<>>
void forEachDiff(SeqA a, int n, SeqB b, int m, OnDiff&& onDiff, Equal eq = Equal{}) {
    const int span = 2 * (n + m) + 1;
    auto data = std::make_unique<int[]>(2 * span);
    constexpr int kCostLimit = 1000;

    DiffOp lastOp = DiffOp::Keep;
    int lastLen = 0;
    detail::diffRange(a, 0, n, b, 0, m, &data[n + m], &data[span + n + m], kCostLimit, eq,
                      [&](DiffOp op, int len) {
                          if (op == lastOp) {
                              lastLen += len;
                              return;
                          }
                          if (lastLen != 0) onDiff(lastOp, lastLen);
                          lastOp = op;
                          lastLen = len;
                      });
    if (lastLen != 0)
        onDiff(lastOp, lastLen);
}

} // namespace jdv

#pragma once

#include <QHash>
#include <QUuid>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace dayplan {
namespace core {

struct Interval
{
    QUuid id;
    // Milliseconds since epoch, half-open [begin, end).
    qint64 begin = 0;
    qint64 end = 0;

    // A degenerate interval (begin == end) covers exactly the instant it sits on.
    qint64 effectiveEnd() const { return end > begin ? end : begin + 1; }
    bool overlaps(qint64 rangeBegin, qint64 rangeEnd) const;
};

// Augmented AVL tree keyed by (begin, id). Every node carries the largest
// effective end of its subtree, so overlap queries run in O(log n + k).
class IntervalIndex
{
public:
    IntervalIndex();
    ~IntervalIndex();
    IntervalIndex(IntervalIndex &&other) noexcept;
    IntervalIndex &operator=(IntervalIndex &&other) noexcept;

    // Replaces any interval previously stored for id.
    void insert(const QUuid &id, qint64 begin, qint64 end);
    bool remove(const QUuid &id);
    void clear();

    bool contains(const QUuid &id) const;
    std::optional<Interval> find(const QUuid &id) const;
    std::size_t size() const;
    bool isEmpty() const;
    int height() const;

    // Intervals overlapping [begin, end), ordered by begin. An empty range
    // behaves like a query for the single instant begin.
    std::vector<Interval> overlapping(qint64 begin, qint64 end) const;
    std::vector<Interval> at(qint64 instant) const;
    // Other intervals overlapping the interval stored for id.
    std::vector<Interval> conflicts(const QUuid &id) const;

private:
    struct Node;

    static int heightOf(const Node *node);
    static void refresh(Node *node);
    static std::unique_ptr<Node> rotateLeft(std::unique_ptr<Node> node);
    static std::unique_ptr<Node> rotateRight(std::unique_ptr<Node> node);
    static std::unique_ptr<Node> rebalance(std::unique_ptr<Node> node);
    static std::unique_ptr<Node> insertNode(std::unique_ptr<Node> node, const Interval &interval);
    static std::unique_ptr<Node> eraseNode(std::unique_ptr<Node> node, const Interval &key);
    static std::unique_ptr<Node> detachMin(std::unique_ptr<Node> node, std::unique_ptr<Node> &min);
    static void collect(const Node *node, qint64 begin, qint64 end, std::vector<Interval> &out);

    std::unique_ptr<Node> m_root;
    QHash<QUuid, Interval> m_byId;
};

} // namespace core
} // namespace dayplan

#include "dayplan/core/IntervalIndex.hpp"

#include "dayplan/core/Logging.hpp"

#include <algorithm>

namespace dayplan {
namespace core {

namespace {

bool keyLess(const Interval &lhs, const Interval &rhs)
{
    if (lhs.begin != rhs.begin) {
        return lhs.begin < rhs.begin;
    }
    return lhs.id < rhs.id;
}

} // namespace

bool Interval::overlaps(qint64 rangeBegin, qint64 rangeEnd) const
{
    const qint64 queryEnd = std::max(rangeEnd, rangeBegin + 1);
    return begin < queryEnd && rangeBegin < effectiveEnd();
}

struct IntervalIndex::Node
{
    explicit Node(const Interval &value)
        : interval(value)
        , maxEnd(value.effectiveEnd())
    {
    }

    Interval interval;
    qint64 maxEnd = 0;
    int height = 1;
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
};

IntervalIndex::IntervalIndex() = default;
IntervalIndex::~IntervalIndex() = default;
IntervalIndex::IntervalIndex(IntervalIndex &&other) noexcept = default;
IntervalIndex &IntervalIndex::operator=(IntervalIndex &&other) noexcept = default;

void IntervalIndex::insert(const QUuid &id, qint64 begin, qint64 end)
{
    remove(id);
    Interval interval{ id, begin, std::max(begin, end) };
    if (end < begin) {
        qCWarning(DAYPLAN_INDEX_LOG) << "Inverted interval for" << id << "stored as reminder";
    }
    m_root = insertNode(std::move(m_root), interval);
    m_byId.insert(id, interval);
}

bool IntervalIndex::remove(const QUuid &id)
{
    const auto it = m_byId.find(id);
    if (it == m_byId.end()) {
        return false;
    }
    m_root = eraseNode(std::move(m_root), it.value());
    m_byId.erase(it);
    return true;
}

void IntervalIndex::clear()
{
    m_root.reset();
    m_byId.clear();
}

bool IntervalIndex::contains(const QUuid &id) const
{
    return m_byId.contains(id);
}

std::optional<Interval> IntervalIndex::find(const QUuid &id) const
{
    const auto it = m_byId.constFind(id);
    if (it == m_byId.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::size_t IntervalIndex::size() const
{
    return static_cast<std::size_t>(m_byId.size());
}

bool IntervalIndex::isEmpty() const
{
    return m_byId.isEmpty();
}

int IntervalIndex::height() const
{
    return heightOf(m_root.get());
}

std::vector<Interval> IntervalIndex::overlapping(qint64 begin, qint64 end) const
{
    std::vector<Interval> result;
    collect(m_root.get(), begin, std::max(end, begin + 1), result);
    return result;
}

std::vector<Interval> IntervalIndex::at(qint64 instant) const
{
    return overlapping(instant, instant + 1);
}

std::vector<Interval> IntervalIndex::conflicts(const QUuid &id) const
{
    const auto interval = find(id);
    if (!interval) {
        return {};
    }
    std::vector<Interval> result = overlapping(interval->begin, interval->effectiveEnd());
    result.erase(std::remove_if(result.begin(), result.end(), [&id](const Interval &other) {
                     return other.id == id;
                 }),
                 result.end());
    return result;
}

int IntervalIndex::heightOf(const Node *node)
{
    return node ? node->height : 0;
}

void IntervalIndex::refresh(Node *node)
{
    node->height = 1 + std::max(heightOf(node->left.get()), heightOf(node->right.get()));
    node->maxEnd = node->interval.effectiveEnd();
    if (node->left) {
        node->maxEnd = std::max(node->maxEnd, node->left->maxEnd);
    }
    if (node->right) {
        node->maxEnd = std::max(node->maxEnd, node->right->maxEnd);
    }
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::rotateLeft(std::unique_ptr<Node> node)
{
    std::unique_ptr<Node> pivot = std::move(node->right);
    node->right = std::move(pivot->left);
    refresh(node.get());
    pivot->left = std::move(node);
    refresh(pivot.get());
    return pivot;
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::rotateRight(std::unique_ptr<Node> node)
{
    std::unique_ptr<Node> pivot = std::move(node->left);
    node->left = std::move(pivot->right);
    refresh(node.get());
    pivot->right = std::move(node);
    refresh(pivot.get());
    return pivot;
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::rebalance(std::unique_ptr<Node> node)
{
    refresh(node.get());
    const int balance = heightOf(node->left.get()) - heightOf(node->right.get());
    if (balance > 1) {
        if (heightOf(node->left->left.get()) < heightOf(node->left->right.get())) {
            node->left = rotateLeft(std::move(node->left));
        }
        return rotateRight(std::move(node));
    }
    if (balance < -1) {
        if (heightOf(node->right->right.get()) < heightOf(node->right->left.get())) {
            node->right = rotateRight(std::move(node->right));
        }
        return rotateLeft(std::move(node));
    }
    return node;
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::insertNode(std::unique_ptr<Node> node, const Interval &interval)
{
    if (!node) {
        return std::make_unique<Node>(interval);
    }
    if (keyLess(interval, node->interval)) {
        node->left = insertNode(std::move(node->left), interval);
    } else {
        node->right = insertNode(std::move(node->right), interval);
    }
    return rebalance(std::move(node));
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::eraseNode(std::unique_ptr<Node> node, const Interval &key)
{
    if (!node) {
        return nullptr;
    }
    if (keyLess(key, node->interval)) {
        node->left = eraseNode(std::move(node->left), key);
    } else if (keyLess(node->interval, key)) {
        node->right = eraseNode(std::move(node->right), key);
    } else {
        if (!node->left) {
            return std::move(node->right);
        }
        if (!node->right) {
            return std::move(node->left);
        }
        std::unique_ptr<Node> successor;
        node->right = detachMin(std::move(node->right), successor);
        successor->left = std::move(node->left);
        successor->right = std::move(node->right);
        node = std::move(successor);
    }
    return rebalance(std::move(node));
}

std::unique_ptr<IntervalIndex::Node> IntervalIndex::detachMin(std::unique_ptr<Node> node, std::unique_ptr<Node> &min)
{
    if (!node->left) {
        std::unique_ptr<Node> right = std::move(node->right);
        min = std::move(node);
        return right;
    }
    node->left = detachMin(std::move(node->left), min);
    return rebalance(std::move(node));
}

void IntervalIndex::collect(const Node *node, qint64 begin, qint64 end, std::vector<Interval> &out)
{
    // Nothing in this subtree reaches past begin.
    if (!node || node->maxEnd <= begin) {
        return;
    }
    collect(node->left.get(), begin, end, out);
    // This node and its right subtree all start at or after end.
    if (node->interval.begin >= end) {
        return;
    }
    if (node->interval.effectiveEnd() > begin) {
        out.push_back(node->interval);
    }
    collect(node->right.get(), begin, end, out);
}

} // namespace core
} // namespace dayplan

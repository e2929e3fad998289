#include "dayplan/core/UndoStack.hpp"

namespace dayplan {
namespace core {

UndoStack::UndoStack(std::size_t limit)
    : m_limit(limit > 0 ? limit : 1)
{
    m_undo.reserve(m_limit);
}

UndoStack::~UndoStack() = default;

void UndoStack::push(EditCommand command)
{
    m_redo.clear();

    if (m_undo.size() == m_limit) {
        m_undo.erase(m_undo.begin());
    }
    m_undo.push_back(std::move(command));
}

bool UndoStack::canUndo() const
{
    return !m_undo.empty();
}

bool UndoStack::canRedo() const
{
    return !m_redo.empty();
}

std::optional<EditCommand> UndoStack::undo()
{
    if (!canUndo()) {
        return std::nullopt;
    }
    EditCommand command = std::move(m_undo.back());
    m_undo.pop_back();
    m_redo.push_back(command);
    return command;
}

std::optional<EditCommand> UndoStack::redo()
{
    if (!canRedo()) {
        return std::nullopt;
    }
    EditCommand command = std::move(m_redo.back());
    m_redo.pop_back();
    m_undo.push_back(command);
    return command;
}

void UndoStack::clear()
{
    m_undo.clear();
    m_redo.clear();
}

std::size_t UndoStack::count() const
{
    return m_undo.size() + m_redo.size();
}

std::size_t UndoStack::undoCount() const
{
    return m_undo.size();
}

std::size_t UndoStack::redoCount() const
{
    return m_redo.size();
}

std::size_t UndoStack::limit() const
{
    return m_limit;
}

} // namespace core
} // namespace dayplan

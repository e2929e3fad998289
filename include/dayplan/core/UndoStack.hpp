#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "dayplan/core/EditCommand.hpp"

namespace dayplan {
namespace core {

class UndoStack
{
public:
    explicit UndoStack(std::size_t limit = 100);
    ~UndoStack();

    // Records an applied command and invalidates everything redoable.
    void push(EditCommand command);
    bool canUndo() const;
    bool canRedo() const;
    // Moves the newest undoable command to the redo stack and returns it.
    std::optional<EditCommand> undo();
    // Moves the newest redoable command back to the undo stack and returns it.
    std::optional<EditCommand> redo();
    void clear();
    std::size_t count() const;
    std::size_t undoCount() const;
    std::size_t redoCount() const;
    std::size_t limit() const;

private:
    std::vector<EditCommand> m_undo;
    std::vector<EditCommand> m_redo;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace dayplan

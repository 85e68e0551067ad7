#pragma once

#include "engine/Color.hpp"
#include "engine/Rect.hpp"
#include "engine/Vec2.hpp"

#include <vector>

namespace skyraid {

/// Debug draw command types
enum class DebugDrawType {
    RectOutline,
    Point,
};

/// A single world-space debug draw command
struct DebugDrawCommand {
    DebugDrawType type = DebugDrawType::RectOutline;
    Rect rect;               // RectOutline
    Vec2 point;              // Point centre
    float radius = 0.0f;     // Point radius
    float thickness = 1.0f;  // RectOutline line width
    Color color = Color::Green();
};

/// Frame-local queue of debug overlay commands.
///
/// Producers (the collision system) append during the tick; the host renderer
/// drains the queue with take() and draws the commands however it likes.
class DebugDraw {
public:
    void drawRectOutline(const Rect& rect, const Color& color, float thickness = 1.0f);
    void drawPoint(Vec2 center, const Color& color, float radius = 3.0f);

    const std::vector<DebugDrawCommand>& commands() const { return m_commands; }
    size_t commandCount() const { return m_commands.size(); }

    /// Hand the queued commands to the caller and start an empty frame
    std::vector<DebugDrawCommand> take();

    void clear() { m_commands.clear(); }

private:
    std::vector<DebugDrawCommand> m_commands;
};

} // namespace skyraid

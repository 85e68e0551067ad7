#include "physics/DebugDraw.hpp"

#include <utility>

namespace skyraid {

void DebugDraw::drawRectOutline(const Rect& rect, const Color& color, float thickness) {
    DebugDrawCommand cmd;
    cmd.type = DebugDrawType::RectOutline;
    cmd.rect = rect;
    cmd.color = color;
    cmd.thickness = thickness;
    m_commands.push_back(cmd);
}

void DebugDraw::drawPoint(Vec2 center, const Color& color, float radius) {
    DebugDrawCommand cmd;
    cmd.type = DebugDrawType::Point;
    cmd.point = center;
    cmd.radius = radius;
    cmd.color = color;
    m_commands.push_back(cmd);
}

std::vector<DebugDrawCommand> DebugDraw::take() {
    std::vector<DebugDrawCommand> out = std::move(m_commands);
    m_commands.clear();
    return out;
}

} // namespace skyraid

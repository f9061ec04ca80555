#pragma once
#include "../debug_panel.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Draw-phase system; draws the DebugPanel overlay in the
// top-right corner, in screen space (after RenderSystem::EndWorld).
//
// Toggle visibility with F3.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Overlay height in pixels for the panel's current rows.
    static int panel_height(const DebugPanel& panel);
};

#include "debug.hpp"
#include <raylib.h>
#include <string>

static constexpr int   PAD      = 8;
static constexpr int   PANEL_W  = 220;
static constexpr int   MARGIN   = 10;
static constexpr int   ROW_H    = 15;
static constexpr int   SEP_H    = 4;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 100;  // content-left to value column
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {120, 200, 230, 255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};

int DebugSystem::panel_height(const DebugPanel& panel) {
    int h = PAD + ROW_H + PAD; // title line
    for (const auto& s : panel.sections()) {
        h += SEP_H + ROW_H * (1 + static_cast<int>(s.rows.size()));
    }
    return h + PAD;
}

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    const int ox = GetScreenWidth() - PANEL_W - MARGIN;
    const int oy = MARGIN;
    const int h  = panel_height(*panel);

    DrawRectangle(ox, oy, PANEL_W, h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, h, DIVIDER);

    int cy = oy + PAD;
    DrawText("DEBUG", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + PANEL_W - PAD - MeasureText("[F3]", FONT_SM), cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    for (const auto& sec : panel->sections()) {
        DrawLine(ox + PAD, cy, ox + PANEL_W - PAD, cy, DIVIDER);
        cy += SEP_H;
        DrawText(sec.title.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
        cy += ROW_H;

        for (const auto& row : sec.rows) {
            const std::string val = row.fn();
            DrawText(row.label.c_str(), ox + PAD + 4,           cy, FONT_SM, C_LABEL);
            DrawText(val.c_str(),       ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
            cy += ROW_H;
        }
    }
}

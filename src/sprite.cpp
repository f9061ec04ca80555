#include "sprite.hpp"
#include "math_util.hpp"

using namespace sprite2d;

DrawCommand Sprite::draw_command(QuadRegion& quad, bool use_screen_space) const {
    ecs::Vec2 pos = {0, 0};
    float rot = 0.0f;
    if (use_screen_space) {
        pos = screen_position;
        rot = screen_rotation;
    } else {
        pos = math::add(position, offset);
        rot = rotation;
    }

    quad.set_viewport(frame.x * frame_size.x, frame.y * frame_size.y,
                      frame_size.x, frame_size.y);

    DrawCommand cmd;
    cmd.texture  = texture;
    cmd.quad     = quad;
    cmd.x        = pos.x;
    cmd.y        = pos.y;
    cmd.rotation = rot;
    cmd.sx       = (flip_x ? -1.0f : 1.0f) * (size.x / frame_size.x);
    cmd.sy       = (flip_y ? -1.0f : 1.0f) * (size.y / frame_size.y);
    // Centred on the frame, no shear
    cmd.ox       = 0.5f * frame_size.x;
    cmd.oy       = 0.5f * frame_size.y;
    cmd.kx       = 0.0f;
    cmd.ky       = 0.0f;
    return cmd;
}

void Sprite::draw(QuadRegion& quad, bool use_screen_space, SpriteRenderer& renderer) const {
    renderer.draw(draw_command(quad, use_screen_space));
}

/**
 * Quadra - Scene Bounds Example
 *
 * Builds a small scene from a frame file, moves it for a few frames and
 * prints the geometry a renderer would receive, plus bounds and hit tests.
 * Runs headless.
 *
 * Usage: example_scene_bounds [frames.toml] [quadra.toml]
 */

#include "quadra/quadra.h"
#include <stdio.h>

static void print_quad(const char *label, const float *v) {
    printf("  %-7s (%.1f, %.1f) (%.1f, %.1f) (%.1f, %.1f) (%.1f, %.1f)\n",
           label, v[0], v[1], v[2], v[3], v[4], v[5], v[6], v[7]);
}

int main(int argc, char *argv[]) {
    const char *frames_path = argc > 1 ? argv[1] : "examples/scene_bounds/assets/frames.toml";
    const char *config_path = argc > 2 ? argv[2] : NULL;

    Quadra_Config config = QUADRA_CONFIG_DEFAULT;
    if (config_path && !quadra_config_load(config_path, &config)) {
        quadra_log_and_clear_error();
    }
    quadra_config_apply(&config);

    Quadra_TextureCache *cache = quadra_texture_cache_create();
    if (!cache || !quadra_texture_cache_load(cache, frames_path)) {
        fprintf(stderr, "Failed to load frames: %s\n", quadra_get_last_error());
        quadra_texture_cache_destroy(cache);
        return 1;
    }

    /* Scene: a ship with a trimmed flame attached behind it */
    Quadra_Node *root = quadra_node_create("root");
    Quadra_Node *ship = quadra_node_create("ship");
    Quadra_Node *flame = quadra_node_create("flame");
    quadra_node_add_child(root, ship);
    quadra_node_add_child(ship, flame);

    Quadra_Sprite *ship_sprite = quadra_sprite_from_frame(cache, ship, "ship");
    Quadra_Sprite *flame_sprite = quadra_sprite_from_frame(cache, flame, "flame");
    if (!ship_sprite || !flame_sprite) {
        fprintf(stderr, "%s\n", quadra_get_last_error());
        quadra_node_destroy(root);
        quadra_texture_cache_destroy(cache);
        return 1;
    }

    quadra_sprite_set_anchor(ship_sprite, 0.5f, 0.5f);
    quadra_sprite_set_width(ship_sprite, 96.0f);
    quadra_sprite_set_anchor(flame_sprite, 0.5f, 0.0f);
    quadra_transform_set_position(quadra_node_get_transform(flame), 0.0f, 20.0f);

    /* A missing frame reports NotFound and leaves the node bare */
    Quadra_Node *ghost = quadra_node_create("ghost");
    quadra_node_add_child(root, ghost);
    if (!quadra_sprite_from_frame(cache, ghost, "ghost")) {
        printf("ghost: %s\n", quadra_get_last_error());
        quadra_clear_error();
    }

    Quadra_Transform *ship_t = quadra_node_get_transform(ship);
    for (int frame = 0; frame < 3; frame++) {
        quadra_transform_set_position(ship_t, 200.0f + 40.0f * frame, 150.0f);
        quadra_transform_set_rotation(ship_t, 0.25f * frame);

        quadra_node_update_transform(root);
        quadra_node_update_geometry(root);

        printf("frame %d\n", frame);
        if (quadra_sprite_geometry_updated(ship_sprite)) {
            const float *v = quadra_sprite_get_vertex_data(ship_sprite);
            print_quad("ship", v);
            quadra_sprite_clear_geometry_updated(ship_sprite);
        }
        if (quadra_sprite_geometry_updated(flame_sprite)) {
            const float *v = quadra_sprite_get_vertex_data(flame_sprite);
            print_quad("flame", v);
            print_quad("bounds", v + QUADRA_SPRITE_BOUNDS_OFFSET);
            quadra_sprite_clear_geometry_updated(flame_sprite);
        }

        Quadra_Rect bounds;
        quadra_node_get_bounds(root, &bounds);
        printf("  scene bounds: x=%.1f y=%.1f w=%.1f h=%.1f\n",
               bounds.x, bounds.y, bounds.width, bounds.height);

        Quadra_Point probe = {200.0f + 40.0f * frame, 150.0f};
        Quadra_Node *hit = quadra_node_hit_test(root, &probe);
        printf("  hit at ship center: %s\n", hit ? quadra_node_get_name(hit) : "(none)");
    }

    quadra_node_destroy(root);
    quadra_texture_cache_destroy(cache);
    quadra_log_shutdown();
    return 0;
}

/*
 * Quadra Scene Node Tests
 *
 * Hierarchy management, visibility, container bounds and hit testing
 * through the renderable capability.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "quadra/node.h"
#include "quadra/error.h"
#include "quadra/generation.h"
#include "quadra/sprite.h"
#include "quadra/texture.h"
#include <string>

using Catch::Approx;

/* ============================================================================
 * Test Fixtures
 * ============================================================================ */

/* Fixed-rectangle renderable that records how it was driven */
struct FakeRenderable {
    Quadra_Rect bounds;
    int compute_calls = 0;
    bool *destroyed = nullptr;
};

static void fake_compute_vertices(void *impl) {
    static_cast<FakeRenderable *>(impl)->compute_calls++;
}

static void fake_compute_bounds(void *impl, Quadra_Rect *out) {
    *out = static_cast<FakeRenderable *>(impl)->bounds;
}

static bool fake_hit_test(void *impl, const Quadra_Point *p) {
    const Quadra_Rect &r = static_cast<FakeRenderable *>(impl)->bounds;
    return p->x > r.x && p->x < r.x + r.width && p->y > r.y && p->y < r.y + r.height;
}

static void fake_destroy(void *impl) {
    FakeRenderable *fake = static_cast<FakeRenderable *>(impl);
    if (fake->destroyed) *fake->destroyed = true;
    delete fake;
}

static const Quadra_RenderableVTable FAKE_VTABLE = {
    "Fake",
    fake_compute_vertices,
    fake_compute_bounds,
    fake_hit_test,
    fake_destroy,
};

static FakeRenderable *attach_fake(Quadra_Node *node, float x, float y, float w, float h) {
    FakeRenderable *fake = new FakeRenderable();
    fake->bounds = {x, y, w, h};
    Quadra_Renderable r = { &FAKE_VTABLE, fake };
    quadra_node_set_renderable(node, r);
    return fake;
}

class NodeTestFixture {
public:
    Quadra_Node *root = nullptr;
    Quadra_Node *a = nullptr;
    Quadra_Node *b = nullptr;
    Quadra_Node *c = nullptr;

    NodeTestFixture() {
        root = quadra_node_create("root");
        a = quadra_node_create("a");
        b = quadra_node_create("b");
        c = quadra_node_create("c");
        quadra_node_add_child(root, a);
        quadra_node_add_child(root, b);
        quadra_node_add_child(root, c);
    }

    ~NodeTestFixture() {
        quadra_node_destroy(root);
        quadra_clear_error();
    }
};

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("Node creation", "[node][lifecycle]") {
    SECTION("Defaults") {
        Quadra_Node *node = quadra_node_create("hero");
        REQUIRE(node != nullptr);
        REQUIRE(std::string(quadra_node_get_name(node)) == "hero");
        REQUIRE(quadra_node_is_visible(node));
        REQUIRE(quadra_node_get_parent(node) == nullptr);
        REQUIRE(quadra_node_get_child_count(node) == 0);
        REQUIRE(quadra_node_get_renderable(node) == nullptr);
        quadra_node_destroy(node);
    }

    SECTION("NULL name becomes empty") {
        Quadra_Node *node = quadra_node_create(nullptr);
        REQUIRE(node != nullptr);
        REQUIRE(quadra_node_get_name(node)[0] == '\0');
        quadra_node_destroy(node);
    }

    SECTION("Destroy NULL is safe") {
        quadra_node_destroy(nullptr);
    }
}

TEST_CASE("Node destroy releases renderables", "[node][lifecycle]") {
    bool destroyed = false;
    Quadra_Node *parent = quadra_node_create("parent");
    Quadra_Node *child = quadra_node_create("child");
    quadra_node_add_child(parent, child);

    FakeRenderable *fake = attach_fake(child, 0, 0, 1, 1);
    fake->destroyed = &destroyed;

    quadra_node_destroy(parent);
    REQUIRE(destroyed);
}

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

TEST_CASE_METHOD(NodeTestFixture, "Node children order", "[node][hierarchy]") {
    REQUIRE(quadra_node_get_child_count(root) == 3);
    REQUIRE(quadra_node_get_child_at(root, 0) == a);
    REQUIRE(quadra_node_get_child_at(root, 1) == b);
    REQUIRE(quadra_node_get_child_at(root, 2) == c);
    REQUIRE(quadra_node_get_child_at(root, 3) == nullptr);
    REQUIRE(quadra_node_get_parent(b) == root);

    SECTION("Insert at index") {
        Quadra_Node *d = quadra_node_create("d");
        REQUIRE(quadra_node_add_child_at(root, d, 1));
        REQUIRE(quadra_node_get_child_at(root, 1) == d);
        REQUIRE(quadra_node_get_child_at(root, 2) == b);
        REQUIRE(quadra_node_get_child_count(root) == 4);
    }

    SECTION("Index past the end appends") {
        Quadra_Node *d = quadra_node_create("d");
        REQUIRE(quadra_node_add_child_at(root, d, 99));
        REQUIRE(quadra_node_get_child_at(root, 3) == d);
    }

    SECTION("Remove child hands it back") {
        REQUIRE(quadra_node_remove_child(root, b));
        REQUIRE(quadra_node_get_child_count(root) == 2);
        REQUIRE(quadra_node_get_child_at(root, 1) == c);
        REQUIRE(quadra_node_get_parent(b) == nullptr);
        quadra_node_destroy(b);
    }

    SECTION("Remove a node that is not a child") {
        REQUIRE_FALSE(quadra_node_remove_child(a, b));
        REQUIRE(quadra_get_last_error_code() == QUADRA_ERROR_NOT_FOUND);
    }

    SECTION("Reparent moves the child") {
        REQUIRE(quadra_node_add_child(a, c));
        REQUIRE(quadra_node_get_child_count(root) == 2);
        REQUIRE(quadra_node_get_parent(c) == a);
    }

    SECTION("Cycles are rejected") {
        REQUIRE(quadra_node_add_child(a, b));
        REQUIRE_FALSE(quadra_node_add_child(b, a));
        REQUIRE_FALSE(quadra_node_add_child(a, a));
        REQUIRE(quadra_node_get_parent(a) == root);
    }

    SECTION("Child-set changes bump the generation") {
        uint64_t gen = quadra_generation_current();
        quadra_node_remove_child(root, c);
        REQUIRE(quadra_generation_current() != gen);
        quadra_node_add_child(root, c);
    }
}

TEST_CASE("Node transform propagation", "[node][transform]") {
    Quadra_Node *root = quadra_node_create("root");
    Quadra_Node *child = quadra_node_create("child");
    Quadra_Node *grandchild = quadra_node_create("grandchild");
    quadra_node_add_child(root, child);
    quadra_node_add_child(child, grandchild);

    quadra_transform_set_position(quadra_node_get_transform(root), 100.0f, 0.0f);
    quadra_transform_set_position(quadra_node_get_transform(child), 10.0f, 0.0f);
    quadra_transform_set_position(quadra_node_get_transform(grandchild), 1.0f, 2.0f);
    quadra_node_update_transform(root);

    const Quadra_Transform *t = quadra_node_get_transform_const(grandchild);
    REQUIRE(t->world.tx == Approx(111.0f));
    REQUIRE(t->world.ty == Approx(2.0f));

    SECTION("Moving to a new parent recomposes against it") {
        quadra_node_add_child(root, grandchild);
        quadra_node_update_transform(root);
        REQUIRE(quadra_node_get_transform_const(grandchild)->world.tx == Approx(101.0f));
    }

    quadra_node_destroy(root);
}

/* ============================================================================
 * Bounds / Geometry
 * ============================================================================ */

TEST_CASE_METHOD(NodeTestFixture, "Container bounds", "[node][bounds]") {
    attach_fake(a, 0, 0, 8, 8);
    attach_fake(b, 5, 5, 10, 10);
    attach_fake(c, -20, -20, 1, 1);

    Quadra_Rect bounds;

    SECTION("Union of visible children") {
        quadra_node_get_bounds(root, &bounds);
        REQUIRE(bounds.x == -20.0f);
        REQUIRE(bounds.y == -20.0f);
        REQUIRE(bounds.width == 35.0f);
        REQUIRE(bounds.height == 35.0f);
    }

    SECTION("Invisible children are skipped") {
        quadra_node_set_visible(c, false);
        quadra_node_get_bounds(root, &bounds);
        REQUIRE(bounds.x == 0.0f);
        REQUIRE(bounds.y == 0.0f);
        REQUIRE(bounds.width == 15.0f);
        REQUIRE(bounds.height == 15.0f);
    }

    SECTION("No visible children gives an empty rect") {
        quadra_node_set_visible(a, false);
        quadra_node_set_visible(b, false);
        quadra_node_set_visible(c, false);
        REQUIRE_FALSE(quadra_node_get_children_bounds(root, &bounds));
        quadra_node_get_bounds(root, &bounds);
        REQUIRE(bounds.width == 0.0f);
        REQUIRE(bounds.height == 0.0f);
    }
}

TEST_CASE_METHOD(NodeTestFixture, "Geometry update skips hidden subtrees", "[node][geometry]") {
    FakeRenderable *fa = attach_fake(a, 0, 0, 1, 1);
    FakeRenderable *fb = attach_fake(b, 0, 0, 1, 1);
    quadra_node_set_visible(b, false);

    quadra_node_update_geometry(root);
    REQUIRE(fa->compute_calls == 1);
    REQUIRE(fb->compute_calls == 0);
}

TEST_CASE_METHOD(NodeTestFixture, "Renderable replacement", "[node][renderable]") {
    bool first_destroyed = false;
    FakeRenderable *first = attach_fake(a, 0, 0, 1, 1);
    first->destroyed = &first_destroyed;

    attach_fake(a, 0, 0, 2, 2);
    REQUIRE(first_destroyed);

    const Quadra_Renderable *r = quadra_node_get_renderable(a);
    REQUIRE(r != nullptr);
    REQUIRE(std::string(r->vtable->type_name) == "Fake");

    Quadra_Renderable none = { nullptr, nullptr };
    quadra_node_set_renderable(a, none);
    REQUIRE(quadra_node_get_renderable(a) == nullptr);
}

/* ============================================================================
 * Hit Testing
 * ============================================================================ */

TEST_CASE_METHOD(NodeTestFixture, "Hit test picks the top-most node", "[node][hit]") {
    attach_fake(a, 0, 0, 10, 10);
    attach_fake(b, 5, 5, 10, 10);

    Quadra_Point overlap = {7.0f, 7.0f};
    Quadra_Point only_a = {2.0f, 2.0f};
    Quadra_Point nothing = {50.0f, 50.0f};

    SECTION("Later sibling wins") {
        REQUIRE(quadra_node_hit_test(root, &overlap) == b);
        REQUIRE(quadra_node_hit_test(root, &only_a) == a);
        REQUIRE(quadra_node_hit_test(root, &nothing) == nullptr);
    }

    SECTION("Hidden nodes are not hit") {
        quadra_node_set_visible(b, false);
        REQUIRE(quadra_node_hit_test(root, &overlap) == a);
    }

    SECTION("Nodes without a renderable contain nothing") {
        REQUIRE_FALSE(quadra_node_contains_point(root, &only_a));
    }
}

TEST_CASE("Hit test through sprites", "[node][hit][sprite]") {
    Quadra_Node *root = quadra_node_create("root");
    Quadra_Node *hero = quadra_node_create("hero");
    quadra_node_add_child(root, hero);

    Quadra_Texture *tex = quadra_texture_create(10.0f, 10.0f);
    Quadra_Sprite *sprite = quadra_sprite_create(hero, tex);
    REQUIRE(sprite != nullptr);
    REQUIRE(quadra_sprite_get(hero) == sprite);
    REQUIRE(quadra_sprite_get(root) == nullptr);

    quadra_transform_set_position(quadra_node_get_transform(hero), 100.0f, 100.0f);
    quadra_node_update_transform(root);

    Quadra_Point inside = {105.0f, 105.0f};
    Quadra_Point outside = {95.0f, 105.0f};
    REQUIRE(quadra_node_hit_test(root, &inside) == hero);
    REQUIRE(quadra_node_hit_test(root, &outside) == nullptr);

    quadra_node_destroy(root);
    quadra_texture_destroy(tex);
}

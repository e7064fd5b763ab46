#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cstdio>
#include <mecs/integration/glm.hpp>
#include <mecs/mecs.hpp>
#include <sstream>

using namespace mecs;

void test_glm_register_idempotent() {
    register_glm_components();
    register_glm_components();
    assert(component_id_by_name("glm::vec3") == component_id<glm::vec3>());
    assert(component_name(component_id<glm::mat4>()) == "glm::mat4");
    for (const char* name : {"glm::vec2", "glm::vec3", "glm::vec4", "glm::quat", "glm::mat4"}) {
        const ComponentInfo* info = find_component_info(component_id_by_name(name));
        assert(info->serialize_fn != nullptr && info->deserialize_fn != nullptr);
    }
    std::printf("  glm register idempotent: OK\n");
}

void test_glm_boxed() {
    register_glm_components();
    DynStorage s(glm::vec3(1.0f, 2.0f, 3.0f));
    assert(s.get<glm::vec3>() != nullptr);
    assert(s.get<glm::vec3>()->y == 2.0f);
    assert(s.get<glm::vec4>() == nullptr);

    std::ostringstream os;
    os << s;
    assert(os.str().rfind("glm::vec3(", 0) == 0);
    std::printf("  glm boxed: OK\n");
}

void test_glm_world_round_trip() {
    register_glm_components();

    World<DynStorage> w1;
    w1.add(make_entity<DynStorage>(glm::vec3(1, 2, 3), glm::quat(1, 0, 0, 0)));
    w1.add(make_entity<DynStorage>(glm::vec3(4, 5, 6)));

    std::stringstream ss;
    serialize(w1, ss);

    World<DynStorage> w2;
    deserialize(w2, ss);
    PredicateId oriented = w2.add_pred([](const Entity<DynStorage>& e) {
        return e.has<glm::vec3>() && e.has<glm::quat>();
    });

    assert(w2.size() == 2);
    assert(*w2.count_pred(oriented) == 1);
    assert(*w2[EntityId(1)].get<glm::vec3>() == glm::vec3(1, 2, 3));
    assert(*w2[EntityId(1)].get<glm::quat>() == glm::quat(1, 0, 0, 0));
    assert(*w2[EntityId(2)].get<glm::vec3>() == glm::vec3(4, 5, 6));
    std::printf("  glm world round trip: OK\n");
}

void test_glm_variant_storage() {
    register_glm_components();
    using Transform = VariantStorage<glm::vec3, glm::quat, glm::mat4>;

    World<Transform> w1;
    w1.add(make_entity<Transform>(glm::vec3(0, 1, 0), glm::mat4(1.0f)));

    std::stringstream ss;
    serialize(w1, ss);
    World<Transform> w2;
    deserialize(w2, ss);
    assert(w1 == w2);
    std::printf("  glm variant storage: OK\n");
}

int main() {
    std::printf("Running mecs GLM integration tests...\n");
    test_glm_register_idempotent();
    test_glm_boxed();
    test_glm_world_round_trip();
    test_glm_variant_storage();
    std::printf("All tests passed!\n");
    return 0;
}

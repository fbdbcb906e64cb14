#pragma once

#include <TetherCore.hpp>
#include <cassert>
#include <iostream>

#include "TestModels.hpp"

namespace serialization_tests {

using test_models::make_manager;
using test_models::num;
using test_models::str;

// ============================================================================
// test_round_trip - restored entity equals the original except for its oid
// ============================================================================

void test_round_trip() {
    std::cout << "  test_round_trip..." << std::flush;

    auto em = make_manager();
    auto tags = tether::json::array({"math", "engines"});
    auto settings = tether::json{{"theme", "dark"}, {"width", 80}};
    std::string bio(1000, 'b');

    em->stage("User", {
        {"id", num(5)},
        {"name", str("Ada")},
        {"age", num(36)},
        {"active", true},
        {"role", str("admin")},
        {"tags", tags},
        {"settings", settings},
        {"bio", bio},
        {"email", nullptr}
    });
    auto user = em->create("User");

    auto bytes = user->to_bytes();
    auto restored = tether::entity::from_bytes(bytes, em.get());

    assert(restored->oid() != user->oid());
    assert(restored->state() == tether::entity_state::managed);
    assert(std::get<int64_t>(restored->identifier().at("id")) == 5);
    assert(std::get<std::string>(restored->get_field("name")) == "Ada");
    assert(std::get<int64_t>(restored->get_field("age")) == 36);
    assert(std::get<bool>(restored->get_field("active")) == true);
    assert(std::get<std::string>(restored->get_field("role")) == "admin");
    assert(std::get<tether::json>(restored->get_field("tags")) == tags);
    assert(std::get<tether::json>(restored->get_field("settings")) == settings);
    assert(std::get<std::string>(restored->get_field("bio")) == bio);
    assert(!restored->is_modified());
    assert(restored->references().empty());

    // Null fields are not carried
    assert(user->data().count("email") == 1);
    assert(restored->data().count("email") == 0);

    std::cout << " OK" << std::endl;
}

void test_round_trip_through_factory() {
    std::cout << "  test_round_trip_through_factory..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    user->set_value("name", str("Grace"));

    auto restored = tether::entity::from_bytes(user->to_bytes());
    assert(&restored->manager() == em.get());
    assert(restored->is_new());
    assert(std::get<std::string>(restored->get_field("name")) == "Grace");
    assert(restored->identifier().empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_snapshot_drops_associations
// ============================================================================

void test_snapshot_drops_associations() {
    std::cout << "  test_snapshot_drops_associations..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    user->set_value("name", str("Ada"));
    user->set_value("address", em->create("Address"));
    user->set_value("posts", tether::collection::make("Post", {em->create("Post")}));

    auto restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    assert(restored->references().empty());
    // entity held in a plain key column is dropped
    assert(restored->data().count("address_id") == 0);
    assert(restored->data().count("name") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_nested_entity_in_object_field
// ============================================================================

void test_nested_entity_in_object_field() {
    std::cout << "  test_nested_entity_in_object_field..." << std::flush;

    auto em = make_manager();
    auto address = em->create("Address");
    address->set_value("city", str("Paris"));
    auto user = em->create("User");
    user->set_value("settings", address);

    auto restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    auto nested = std::get<tether::entity_ptr>(restored->get_field("settings"));
    assert(nested != address);
    assert(nested->entity_name() == "Address");
    assert(std::get<std::string>(nested->get_field("city")) == "Paris");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_composite_identifier_round_trip
// ============================================================================

void test_composite_identifier_round_trip() {
    std::cout << "  test_composite_identifier_round_trip..." << std::flush;

    auto em = make_manager();
    em->stage("OrderLine", {{"order_id", num(1)}, {"quantity", num(3)}});
    auto line = em->create("OrderLine");

    auto bytes = line->to_bytes();
    // the live entity is not touched by the snapshot
    assert(line->data().count("product_id") == 0);

    auto restored = tether::entity::from_bytes(bytes, em.get());
    assert(restored->identifier().size() == 2);
    assert(std::get<int64_t>(restored->identifier().at("order_id")) == 1);
    assert(tether::is_null(restored->identifier().at("product_id")));
    assert(std::get<int64_t>(restored->get_field("quantity")) == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_malformed_snapshot
// ============================================================================

void test_malformed_snapshot() {
    std::cout << "  test_malformed_snapshot..." << std::flush;

    auto em = make_manager();

    auto expect_failure = [&](const tether::blob_t& bytes) {
        bool threw = false;
        try {
            tether::entity::from_bytes(bytes, em.get());
        } catch (const tether::serialization_error&) {
            threw = true;
        }
        assert(threw);
    };

    expect_failure({0xff, 0x00, 0x13});
    expect_failure(tether::json::to_cbor(tether::json::array({1, 2})));
    expect_failure(tether::json::to_cbor(tether::json{
        {"entity", "User"}, {"state", 5}, {"data", tether::json::object()}}));
    expect_failure(tether::json::to_cbor(tether::json{
        {"entity", "User"}, {"state", 1},
        {"data", {{"bio", tether::json::binary({1, 2, 3})}}}}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_cycle_round_trip - entities that hold each other survive
// ============================================================================

void test_reference_cycle_round_trip() {
    std::cout << "  test_reference_cycle_round_trip..." << std::flush;

    auto em = make_manager();
    auto u = em->create("User");
    auto v = em->create("User");
    u->set_value("name", str("u"));
    v->set_value("name", str("v"));
    u->set_value("settings", v);
    v->set_value("settings", u);

    auto restored = tether::entity::from_bytes(u->to_bytes(), em.get());
    auto restored_v = std::get<tether::entity_ptr>(restored->get_field("settings"));
    assert(restored_v != v);
    assert(std::get<std::string>(restored_v->get_field("name")) == "v");
    assert(std::get<tether::entity_ptr>(restored_v->get_field("settings")) == restored);

    // An entity holding itself
    auto w = em->create("User");
    w->set_value("settings", w);
    auto restored_w = tether::entity::from_bytes(w->to_bytes(), em.get());
    assert(std::get<tether::entity_ptr>(restored_w->get_field("settings")) == restored_w);

    // Back reference deeper than the enclosing snapshots
    tether::json bad = {
        {"entity", "User"}, {"state", 2},
        {"data", {{"settings", tether::json::binary(tether::json::to_cbor(tether::json(3)), 2)}}}
    };
    bool threw = false;
    try {
        tether::entity::from_bytes(tether::json::to_cbor(bad), em.get());
    } catch (const tether::serialization_error&) {
        threw = true;
    }
    assert(threw);

    for (const auto& e : {u, v, w, restored, restored_v, restored_w}) {
        e->free();
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_change_set_round_trip - pending changes are carried by the snapshot
// ============================================================================

void test_change_set_round_trip() {
    std::cout << "  test_change_set_round_trip..." << std::flush;

    auto em = make_manager();
    em->stage("User", {{"id", num(1)}, {"name", str("Ada")}, {"role", str("member")}});
    auto user = em->create("User");
    std::string bio(500, 'q');

    user->set_value("name", str("Grace"));
    user->set_value("role", str("admin"));
    user->set_value("bio", bio);

    auto restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    assert(restored->is_modified());
    assert(restored->change_set().size() == 3);

    const auto& name = restored->change_set().at("name");
    assert(std::get<std::string>(name.first) == "Ada");
    assert(std::get<std::string>(name.second) == "Grace");
    assert(std::get<std::string>(restored->change_set().at("role").first) == "member");
    assert(tether::is_null(restored->change_set().at("bio").first));

    auto payload = restored->build_write_payload();
    assert(payload.size() == 3);
    assert(std::get<std::string>(payload.at("name")) == "Grace");
    assert(std::get<int64_t>(payload.at("role")) == 2);
    assert(tether::codec::decompress(std::get<tether::blob_t>(payload.at("bio"))) == bio);

    // Synchronized entities stay clean
    user->assign_identifier(num(1));
    assert(!tether::entity::from_bytes(user->to_bytes(), em.get())->is_modified());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_raw_enum_value_round_trip - values outside the enumeration are kept
// ============================================================================

void test_raw_enum_value_round_trip() {
    std::cout << "  test_raw_enum_value_round_trip..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");

    // 1 is the code of "member" but not itself an enumerated value
    user->set_value("role", num(1));
    auto restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    assert(std::get<int64_t>(restored->get_field("role")) == 1);
    assert(std::get<int64_t>(restored->change_set().at("role").second) == 1);

    user->set_value("role", str("superuser"));
    restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    assert(std::get<std::string>(restored->get_field("role")) == "superuser");

    user->set_value("role", str("member"));
    restored = tether::entity::from_bytes(user->to_bytes(), em.get());
    assert(std::get<std::string>(restored->get_field("role")) == "member");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unregistered_snapshot_type
// ============================================================================

void test_unregistered_snapshot_type() {
    std::cout << "  test_unregistered_snapshot_type..." << std::flush;

    auto em = make_manager();
    auto bytes = tether::json::to_cbor(tether::json{
        {"entity", "Ghost"}, {"state", 2}, {"data", tether::json::object()}});

    // Unknown to the given manager
    bool threw = false;
    try {
        tether::entity::from_bytes(bytes, em.get());
    } catch (const tether::serialization_error&) {
        threw = true;
    }
    assert(threw);

    // No manager bound in the factory
    em.reset();
    threw = false;
    try {
        tether::entity::from_bytes(bytes);
    } catch (const tether::serialization_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

} // namespace serialization_tests

#pragma once

#include <TetherCore.hpp>
#include <cassert>
#include <iostream>
#include <memory>

#include "TestModels.hpp"

namespace reference_tests {

using test_models::make_manager;
using test_models::str;

// ============================================================================
// test_one_to_many_replaced_in_place - cached collection object survives
// ============================================================================

void test_one_to_many_replaced_in_place() {
    std::cout << "  test_one_to_many_replaced_in_place..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto p1 = em->create("Post");
    auto p2 = em->create("Post");
    auto p3 = em->create("Post");

    auto first = tether::collection::make("Post", {p1});
    user->set_value("posts", first);
    assert(std::get<tether::collection_ptr>(user->get_reference("posts")) == first);

    auto second = tether::collection::make("Post", {p2, p3});
    user->set_value("posts", second);

    auto cached = std::get<tether::collection_ptr>(user->get_reference("posts"));
    assert(cached == first);
    assert(cached->size() == 2);
    assert(cached->at(0) == p2);
    assert(cached->contains(*p3));
    assert(!cached->contains(*p1));

    // Associations never enter the change set
    assert(!user->is_modified());

    bool threw = false;
    try {
        cached->at(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_shape_mismatch - each relation shape rejects the wrong value
// ============================================================================

void test_reference_shape_mismatch() {
    std::cout << "  test_reference_shape_mismatch..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto post = em->create("Post");

    auto expect_kind = [&](const std::string& name, const tether::value_t& value,
                           tether::reference_kind kind) {
        bool threw = false;
        try {
            user->set_value(name, value);
        } catch (const tether::invalid_reference_error& e) {
            threw = true;
            assert(e.kind() == kind);
            assert(e.relation() == name);
        }
        assert(threw);
    };

    expect_kind("posts", post, tether::reference_kind::one_to_many);
    expect_kind("address", tether::collection::make("Address"), tether::reference_kind::one_to_one);
    expect_kind("address", str("Paris"), tether::reference_kind::one_to_one);
    expect_kind("groups", post, tether::reference_kind::many_to_many);

    assert(user->references().empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_local_key_to_one - owning side writes the related entity into its key
// ============================================================================

void test_local_key_to_one() {
    std::cout << "  test_local_key_to_one..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto address = em->create("Address");

    user->set_value("address", address);

    assert(std::get<tether::entity_ptr>(user->get_reference("address")) == address);
    assert(std::get<tether::entity_ptr>(user->get_field("address_id")) == address);
    assert(user->change_set().count("address_id") == 1);
    assert(user->change_set().count("address") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_local_key_by_foreign_field - key copied from a non-identifier column
// ============================================================================

void test_local_key_by_foreign_field() {
    std::cout << "  test_local_key_by_foreign_field..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto address = em->create("Address");
    address->set_value("code", str("P-75"));

    user->set_value("address_by_code", address);

    assert(std::get<std::string>(user->get_field("address_code")) == "P-75");
    assert(std::get<tether::entity_ptr>(user->get_reference("address_by_code")) == address);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_inverse_side_write_back - inverse side points the related entity back
// ============================================================================

void test_inverse_side_write_back() {
    std::cout << "  test_inverse_side_write_back..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto profile = em->create("Profile");

    user->set_value("profile", profile);

    assert(std::get<tether::entity_ptr>(profile->get_field("user_id")) == user);
    assert(profile->is_modified());
    assert(!user->is_modified());
    assert(std::get<tether::entity_ptr>(user->get_reference("profile")) == profile);

    // Write-back needs shared ownership of the inverse side
    tether::entity loose(*em, "User");
    bool threw = false;
    try {
        loose.set_value("profile", em->create("Profile"));
    } catch (const tether::entity_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_lazy_loading - relations load once through the manager
// ============================================================================

void test_lazy_loading() {
    std::cout << "  test_lazy_loading..." << std::flush;

    auto em = make_manager();
    auto post = em->create("Post");
    int calls = 0;
    em->set_relation_loader("User", "posts",
        [&](tether::entity& owner, const tether::relation_descriptor& relation) -> tether::value_t {
            ++calls;
            assert(owner.entity_name() == "User");
            assert(relation.target == "Post");
            return tether::collection::make("Post", {post});
        });

    auto user = em->create("User");
    assert(!user->has_reference("posts"));

    auto loaded = std::get<tether::collection_ptr>(user->get_value("posts"));
    assert(loaded->size() == 1);
    assert(calls == 1);
    assert(user->has_reference("posts"));

    auto again = std::get<tether::collection_ptr>(user->get_value("posts"));
    assert(again == loaded);
    assert(calls == 1);

    // Eager relations never load on access
    assert(tether::is_null(user->get_value("manager")));
    assert(!user->has_reference("manager"));

    // No loader registered: loaded as null
    assert(tether::is_null(user->get_value("groups")));
    assert(user->has_reference("groups"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_accessors
// ============================================================================

void test_reference_accessors() {
    std::cout << "  test_reference_accessors..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");

    bool threw = false;
    try {
        user->get_reference("address");
    } catch (const tether::unknown_reference_error&) {
        threw = true;
    }
    assert(threw);

    auto recent = tether::collection::make("Post");
    user->set_related("recent_posts", recent);
    assert(user->has_reference("recent_posts"));
    assert(std::get<tether::collection_ptr>(user->get_reference("recent_posts")) == recent);

    // null is stored as loaded-null
    user->set_value("address", nullptr);
    assert(user->has_reference("address"));
    assert(tether::is_null(user->get_reference("address")));
    assert(!user->contains("address"));

    user->set_value("address", em->create("Address"));
    assert(user->contains("address"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove_references
// ============================================================================

void test_remove_references() {
    std::cout << "  test_remove_references..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto posts = tether::collection::make("Post", {em->create("Post"), em->create("Post")});
    user->set_value("address", em->create("Address"));
    user->set_value("posts", posts);

    user->remove("address");
    assert(tether::is_null(user->get_reference("address")));

    user->remove("posts");
    assert(posts->empty());
    assert(std::get<tether::collection_ptr>(user->get_reference("posts")) == posts);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_free_deep - recursive free across a reference cycle
// ============================================================================

void test_free_deep() {
    std::cout << "  test_free_deep..." << std::flush;

    auto em = make_manager();
    auto user = em->create("User");
    auto address = em->create("Address");
    auto post = em->create("Post");
    address->set_value("city", str("Paris"));
    post->set_value("title", str("Hello"));

    user->set_value("address", address);
    address->set_value("resident", user);
    auto posts = tether::collection::make("Post", {post});
    user->set_value("posts", posts);

    user->free(true);

    assert(user->data().empty());
    assert(user->references().empty());
    assert(address->data().empty());
    assert(address->references().empty());
    assert(post->data().empty());
    assert(posts->empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_inverse_side_pair_released - free() on either side breaks the
// ownership cycle of an inverse-side to-one assignment
// ============================================================================

void test_inverse_side_pair_released() {
    std::cout << "  test_inverse_side_pair_released..." << std::flush;

    auto em = make_manager();

    auto assign_pair = [&](bool free_user) {
        std::weak_ptr<tether::entity> weak_user;
        std::weak_ptr<tether::entity> weak_profile;
        {
            auto user = em->create("User");
            auto profile = em->create("Profile");
            weak_user = user;
            weak_profile = profile;

            user->set_value("profile", profile);
            if (free_user) {
                user->free();
            } else {
                profile->free();
            }
        }
        assert(weak_user.expired());
        assert(weak_profile.expired());
    };

    assign_pair(true);
    assign_pair(false);

    std::cout << " OK" << std::endl;
}

} // namespace reference_tests

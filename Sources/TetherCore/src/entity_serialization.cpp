#include "tether/entity.hpp"
#include "tether/codec.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

namespace {

// Binary subtypes used for entities held in object fields
constexpr std::uint64_t nested_entity_subtype = 1;   // embedded snapshot
constexpr std::uint64_t back_reference_subtype = 2;  // depth of an enclosing snapshot

bool has_subtype(const json& encoded, std::uint64_t subtype) {
    return encoded.is_binary() && encoded.get_binary().has_subtype() &&
           encoded.get_binary().subtype() == subtype;
}

blob_t binary_bytes(const json& encoded) {
    const auto& bin = encoded.get_binary();
    return blob_t(bin.begin(), bin.end());
}

json parse_snapshot(const blob_t& bytes) {
    try {
        // keep tags so nested snapshots retain their binary subtype
        return json::from_cbor(bytes, true, true, json::cbor_tag_handler_t::store);
    } catch (const json::exception& e) {
        LOG_ERROR(log_tag::snapshot, "Malformed snapshot: %s", e.what());
        throw serialization_error(std::string("Malformed snapshot: ") + e.what());
    }
}

} // namespace

// ============================================================================
// Field encodings
// ============================================================================

json entity::encode_field(const std::string& name, const value_t& value) const {
    switch (class_->type_of_field(name)) {
        case field_type::array:
        case field_type::object:
            return codec::flatten(value);
        case field_type::compressed_text:
            return json::binary(codec::compress(value, em_->config().snapshot_compression_level));
        case field_type::enumerated:
            if (auto code = class_->enum_code_of(name, value)) {
                return *code;
            }
            // tagged so a raw integer is not mistaken for a code on decode
            return json{{"raw", codec::to_json(value)}};
        case field_type::boolean:
        case field_type::plain:
            break;
    }
    return codec::to_json(value);
}

value_t entity::decode_field(const std::string& name, const json& encoded) const {
    switch (class_->type_of_field(name)) {
        case field_type::object:
        case field_type::array:
            if (encoded.is_string()) {
                return codec::restore_structured(encoded.get<std::string>());
            }
            break;
        case field_type::compressed_text:
            if (encoded.is_binary()) {
                return codec::decompress(binary_bytes(encoded));
            }
            break;
        case field_type::enumerated:
            if (encoded.is_number_integer()) {
                return class_->enum_value_of(name, encoded.get<int64_t>());
            }
            if (encoded.is_object() && encoded.contains("raw")) {
                return codec::from_json(encoded["raw"]);
            }
            break;
        case field_type::boolean:
        case field_type::plain:
            break;
    }
    return codec::from_json(encoded);
}

json entity::encode_value(const std::string& name, const value_t& value, snapshot_path_t& path) const {
    if (is_null(value)) {
        return nullptr;
    }
    if (std::holds_alternative<collection_ptr>(value)) {
        return json(json::value_t::discarded);
    }
    if (auto* related = std::get_if<entity_ptr>(&value)) {
        // only object fields carry entities; key columns are resolved by the persister
        if (!*related || class_->type_of_field(name) != field_type::object) {
            return json(json::value_t::discarded);
        }
        auto enclosing = std::find(path.begin(), path.end(), related->get());
        if (enclosing != path.end()) {
            json depth = static_cast<std::uint64_t>(enclosing - path.begin());
            return json::binary(json::to_cbor(depth), back_reference_subtype);
        }
        return json::binary(json::to_cbor((*related)->encode_snapshot(path)), nested_entity_subtype);
    }
    return encode_field(name, value);
}

value_t entity::decode_value(const std::string& name, const json& encoded, restore_path_t& path) const {
    if (encoded.is_null()) {
        return nullptr;
    }
    if (class_->type_of_field(name) == field_type::object) {
        if (has_subtype(encoded, nested_entity_subtype)) {
            return decode_snapshot(parse_snapshot(binary_bytes(encoded)), em_, path);
        }
        if (has_subtype(encoded, back_reference_subtype)) {
            auto depth = json::from_cbor(binary_bytes(encoded)).get<std::uint64_t>();
            if (depth >= path.size()) {
                throw serialization_error("Back reference in " + name + " points outside the snapshot");
            }
            return path[depth];
        }
    }
    return decode_field(name, encoded);
}

// ============================================================================
// Snapshot
// ============================================================================

blob_t entity::to_bytes() const {
    snapshot_path_t path;
    return json::to_cbor(encode_snapshot(path));
}

json entity::encode_snapshot(snapshot_path_t& path) const {
    path.push_back(this);

    // identity folded over the fields, in the snapshot only
    data_t snapshot = data_;
    for (const auto& [name, value] : id_) {
        snapshot[name] = value;
    }

    json fields = json::object();
    for (const auto& [name, value] : snapshot) {
        if (is_null(value)) {
            continue;
        }
        json encoded = encode_value(name, value, path);
        if (!encoded.is_discarded()) {
            fields[name] = std::move(encoded);
        }
    }

    json changes = json::object();
    for (const auto& [name, change] : modified_) {
        json after = encode_value(name, change.second, path);
        if (after.is_discarded()) {
            continue;
        }
        json before = encode_value(name, change.first, path);
        if (before.is_discarded()) {
            before = nullptr;
        }
        changes[name] = json::array({std::move(before), std::move(after)});
    }

    json identity = json::object();
    for (const auto& [name, value] : id_) {
        if (std::holds_alternative<entity_ptr>(value) || std::holds_alternative<collection_ptr>(value)) {
            continue;
        }
        identity[name] = codec::to_json(value);
    }

    path.pop_back();

    json doc = {
        {"entity", entity_name_},
        {"state", static_cast<int>(state_)},
        {"oid", 0},
        {"data", std::move(fields)},
        {"id", std::move(identity)},
        {"modified", std::move(changes)}
    };
    return doc;
}

entity_ptr entity::from_bytes(const blob_t& bytes, entity_manager* em) {
    restore_path_t path;
    return decode_snapshot(parse_snapshot(bytes), em, path);
}

entity_ptr entity::decode_snapshot(const json& doc, entity_manager* em, restore_path_t& path) {
    if (!doc.is_object() ||
        !doc.contains("entity") || !doc["entity"].is_string() ||
        !doc.contains("state") || !doc["state"].is_number_integer() ||
        !doc.contains("data") || !doc["data"].is_object()) {
        throw serialization_error("Snapshot is missing entity, state or data");
    }

    auto name = doc["entity"].get<std::string>();

    entity_ptr restored;
    try {
        entity_manager& manager = em ? *em : entity_manager_factory::instance().get_manager(name);
        restored.reset(new entity(manager, name, restore_tag{}));
    } catch (const entity_error& e) {
        LOG_ERROR(log_tag::snapshot, "Cannot restore %s: %s", name.c_str(), e.what());
        throw serialization_error("Snapshot type " + name + " cannot be restored: " + e.what());
    }

    auto state = static_cast<entity_state>(doc["state"].get<int>());
    try {
        restored->set_state(state);
    } catch (const invalid_state_error& e) {
        throw serialization_error(std::string("Snapshot has ") + e.what());
    }

    path.push_back(restored);
    try {
        for (const auto& [field, encoded] : doc["data"].items()) {
            restored->data_[field] = restored->decode_value(field, encoded, path);
        }
        if (doc.contains("id") && doc["id"].is_object()) {
            for (const auto& [field, encoded] : doc["id"].items()) {
                restored->id_[field] = codec::from_json(encoded);
            }
        }
        if (doc.contains("modified") && doc["modified"].is_object()) {
            for (const auto& [field, encoded] : doc["modified"].items()) {
                if (!encoded.is_array() || encoded.size() != 2) {
                    throw serialization_error("Change of " + field + " is not an (old, new) pair");
                }
                restored->modified_[field] = change_t(restored->decode_value(field, encoded[0], path),
                                                      restored->decode_value(field, encoded[1], path));
            }
        }
    } catch (const codec_error& e) {
        throw serialization_error(std::string("Snapshot field could not be decoded: ") + e.what());
    } catch (const json::exception& e) {
        throw serialization_error(std::string("Snapshot field could not be decoded: ") + e.what());
    }
    path.pop_back();

    restored->extract_identifier();
    LOG_DEBUG(log_tag::snapshot, "Restored %s #%llu", name.c_str(),
              static_cast<unsigned long long>(restored->oid_));
    return restored;
}

} // namespace tether

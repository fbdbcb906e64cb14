#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace tether {

/// Base class of everything the entity core throws for misuse of an entity.
class entity_error : public std::runtime_error {
public:
    explicit entity_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Internal, non-loading accessor hit a name that is neither a loaded field
/// nor a loaded reference.
class unknown_field_error : public entity_error {
public:
    explicit unknown_field_error(const std::string& field)
        : entity_error("Unknown field: " + field), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// Public accessor/mutator was given a name the class metadata does not
/// declare as a field or relation.
class invalid_field_error : public entity_error {
public:
    invalid_field_error(const std::string& entity_name, const std::string& field)
        : entity_error("Invalid field '" + field + "' for entity " + entity_name), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class invalid_state_error : public entity_error {
public:
    explicit invalid_state_error(int state)
        : entity_error("Invalid entity state: " + std::to_string(state)), state_(state) {}

    int state() const { return state_; }

private:
    int state_;
};

enum class reference_kind {
    one_to_many,
    one_to_one,
    many_to_many
};

/// The value given for an association does not match the relation's shape.
class invalid_reference_error : public entity_error {
public:
    invalid_reference_error(reference_kind kind, const std::string& relation)
        : entity_error(describe(kind, relation)), kind_(kind), relation_(relation) {}

    reference_kind kind() const { return kind_; }
    const std::string& relation() const { return relation_; }

private:
    static std::string describe(reference_kind kind, const std::string& relation) {
        switch (kind) {
            case reference_kind::one_to_many:
                return "One-to-many relation '" + relation + "' expects a collection";
            case reference_kind::one_to_one:
                return "One-to-one relation '" + relation + "' expects an entity";
            case reference_kind::many_to_many:
                return "Many-to-many relation '" + relation + "' expects a collection";
        }
        return "Invalid reference value for '" + relation + "'";
    }

    reference_kind kind_;
    std::string relation_;
};

/// Requested a reference that was never loaded or set.
class unknown_reference_error : public entity_error {
public:
    explicit unknown_reference_error(const std::string& name)
        : entity_error("Unknown reference " + name) {}
};

/// Identifier assignment does not fit the identifier shape of the class.
class invalid_identifier_error : public entity_error {
public:
    explicit invalid_identifier_error(const std::string& msg) : entity_error(msg) {}
};

class serialization_error : public std::runtime_error {
public:
    explicit serialization_error(const std::string& msg) : std::runtime_error(msg) {}
};

class codec_error : public std::runtime_error {
public:
    explicit codec_error(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace tether

#endif // __cplusplus

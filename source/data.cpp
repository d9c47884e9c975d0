// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file data.cpp
/// @brief Data helpers: construction, freezing, thawing, ordering

#include <live_tree/data.h>
#include <live_tree/builders.h>
#include <live_tree/errors.h>

#include <tsl/robin_set.h>

#include <sstream>

namespace live_tree {

// ============================================================
// Data members
// ============================================================

Data Data::map(std::initializer_list<std::pair<std::string, Data>> init) {
    auto result = std::make_shared<JsonMap>();
    for (const auto& [key, value] : init) {
        result->insert_or_assign(key, value);
    }
    return Data{std::move(result)};
}

Data Data::array(std::initializer_list<Data> init) {
    return Data{std::make_shared<JsonArray>(init)};
}

MapView Data::as_map() const {
    if (auto* view = get_if<MapView>()) return *view;
    throw AccessError(AccessFailure::NotAView, "expected a map view, got " + data_to_string(*this));
}

ArrayView Data::as_array() const {
    if (auto* view = get_if<ArrayView>()) return *view;
    throw AccessError(AccessFailure::NotAView, "expected a sequence view, got " + data_to_string(*this));
}

// ============================================================
// Freezing
// ============================================================

namespace {

class Freezer {
public:
    Value freeze(const Data& data) {
        return std::visit([this](const auto& v) { return freeze_alt(v); }, data.data);
    }

private:
    Value freeze_alt(std::monostate) { return Value{}; }
    Value freeze_alt(bool v) { return Value{v}; }
    Value freeze_alt(int64_t v) { return Value{v}; }
    Value freeze_alt(double v) { return Value{v}; }
    Value freeze_alt(const std::string& v) { return Value{v}; }
    Value freeze_alt(const ByteBuffer& v) { return Value{v}; }
    Value freeze_alt(const Value& v) { return v; }
    Value freeze_alt(const MapView& v) { return v.to_json(); }
    Value freeze_alt(const ArrayView& v) { return v.to_json(); }
    Value freeze_alt(const SharedMapPtr& v) { return v->to_plain(); }
    Value freeze_alt(const SharedArrayPtr& v) { return v->to_plain(); }

    Value freeze_alt(const Foreign& v) {
        throw ConversionError(ConversionFailure::UnsupportedType,
                              "cannot convert a value of type '" + v.type_name + "'");
    }

    Value freeze_alt(const JsonMapPtr& map) {
        ActiveGuard guard(*this, map.get());
        MapBuilder builder;
        for (const auto& [key, value] : *map) {
            builder.set(key, freeze(value));
        }
        return builder.finish();
    }

    Value freeze_alt(const JsonArrayPtr& array) {
        ActiveGuard guard(*this, array.get());
        VectorBuilder builder;
        for (const auto& item : *array) {
            builder.push_back(freeze(item));
        }
        return builder.finish();
    }

    struct ActiveGuard {
        Freezer& self;
        const void* key;

        ActiveGuard(Freezer& f, const void* k) : self(f), key(k) {
            if (!self.active_.insert(key).second) {
                throw ConversionError(ConversionFailure::CyclicStructure,
                                      "plain container contains itself");
            }
        }
        ~ActiveGuard() { self.active_.erase(key); }
    };

    tsl::robin_set<const void*> active_;
};

int type_rank(const Data& data) noexcept {
    if (data.is_null()) return 4;
    if (data.is_number()) return 0;
    if (data.is_string()) return 1;
    if (data.is_bool()) return 2;
    return 3;
}

} // anonymous namespace

Value to_value(const Data& data) {
    Freezer freezer;
    return freezer.freeze(data);
}

// ============================================================
// Thawing
// ============================================================

Data from_value(const Value& value) {
    if (auto* map = value.get_if<ValueMap>()) {
        auto result = std::make_shared<JsonMap>();
        result->reserve(map->size());
        for (const auto& [key, box] : *map) {
            result->insert_or_assign(key, from_value(box.get()));
        }
        return Data{std::move(result)};
    }
    if (auto* vec = value.get_if<ValueVector>()) {
        auto result = std::make_shared<JsonArray>();
        result->reserve(vec->size());
        for (const auto& box : *vec) {
            result->push_back(from_value(box.get()));
        }
        return Data{std::move(result)};
    }
    return shallow_from_value(value);
}

Data shallow_from_value(const Value& value) {
    if (value.is_null()) return Data{};
    if (auto* b = value.get_if<bool>()) return Data{*b};
    if (auto* i = value.get_if<int64_t>()) return Data{*i};
    if (auto* d = value.get_if<double>()) return Data{*d};
    if (auto* s = value.get_if<std::string>()) return Data{*s};
    if (value.is_bytes()) return Data{value.as_bytes()};
    return Data{value};
}

// ============================================================
// Comparison
// ============================================================

bool deep_equal(const Data& data, const Value& expected) {
    if (auto* map = data.get_if<JsonMapPtr>()) {
        auto* other = expected.get_if<ValueMap>();
        if (!other || other->size() != (*map)->size()) return false;
        for (const auto& [key, value] : **map) {
            auto* box = other->find(key);
            if (!box || !deep_equal(value, box->get())) return false;
        }
        return true;
    }
    if (auto* array = data.get_if<JsonArrayPtr>()) {
        auto* other = expected.get_if<ValueVector>();
        if (!other || other->size() != (*array)->size()) return false;
        for (std::size_t i = 0; i < other->size(); ++i) {
            if (!deep_equal((**array)[i], (*other)[i].get())) return false;
        }
        return true;
    }
    if (data.is_foreign()) return false;
    if (data.is_value() || data.is_view() || data.is_store_node()) {
        return to_value(data) == expected;
    }
    return data == shallow_from_value(expected);
}

bool default_less(const Data& a, const Data& b) {
    const int ra = type_rank(a);
    const int rb = type_rank(b);
    if (ra != rb) return ra < rb;
    if (ra == 0) return a.as_number() < b.as_number();
    if (ra == 1) return *a.get_if<std::string>() < *b.get_if<std::string>();
    if (ra == 2) return !a.as_bool() && b.as_bool();
    return false;
}

std::string data_to_string(const Data& data) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                oss << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                oss << '"' << v << '"';
            } else if constexpr (std::is_same_v<T, ByteBuffer>) {
                oss << "<bytes:" << v.size() << ">";
            } else if constexpr (std::is_same_v<T, JsonMapPtr>) {
                oss << "{map:" << (v ? v->size() : 0) << "}";
            } else if constexpr (std::is_same_v<T, JsonArrayPtr>) {
                oss << "[array:" << (v ? v->size() : 0) << "]";
            } else if constexpr (std::is_same_v<T, Value>) {
                oss << "raw " << value_to_string(v);
            } else if constexpr (std::is_same_v<T, MapView>) {
                oss << "<map view>";
            } else if constexpr (std::is_same_v<T, ArrayView>) {
                oss << "<sequence view>";
            } else if constexpr (std::is_same_v<T, SharedMapPtr>) {
                oss << "<store map #" << (v ? v->id() : 0) << ">";
            } else if constexpr (std::is_same_v<T, SharedArrayPtr>) {
                oss << "<store sequence #" << (v ? v->id() : 0) << ">";
            } else {
                oss << "<" << v.type_name << ">";
            }
        },
        data.data);
    return oss.str();
}

} // namespace live_tree

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace toolgov {

// Declared shape of a tool result, supplied ahead of execution. Stands in
// for runtime reflection: tool authors describe what they return and the
// cost estimator applies the same arithmetic reflection would.
struct ShapeDescriptor {
    enum class Kind {
        Primitive,   // numbers, booleans
        Text,        // strings
        Date,        // timestamps, dates
        Collection,  // list of `item`
        Object,      // structured type with known member counts
        Response,    // envelope wrapping an optional `item`
        Opaque       // structured type with no introspection available
    };

    Kind kind{Kind::Opaque};
    std::string name;
    std::shared_ptr<const ShapeDescriptor> item;
    std::size_t property_count{0};
    std::size_t method_count{0};

    static ShapeDescriptor primitive(std::string name = "number");
    static ShapeDescriptor text();
    static ShapeDescriptor date();
    static ShapeDescriptor collection_of(ShapeDescriptor item);
    static ShapeDescriptor object(std::string name, std::size_t properties,
                                  std::size_t methods = 0);
    static ShapeDescriptor response(std::string name);
    static ShapeDescriptor response(std::string name, ShapeDescriptor item);
    static ShapeDescriptor opaque(std::string name = {});

    // Name looks like a "...Response" / "...Result" wrapper
    bool looks_like_response() const;
};

// Static introspection. Specialise for your own result types, e.g.
//   template <> struct shape_traits<SearchResponse> {
//       static ShapeDescriptor describe() {
//           return ShapeDescriptor::response("SearchResponse", ...);
//       }
//   };
template <typename T, typename Enable = void>
struct shape_traits {
    static ShapeDescriptor describe() { return ShapeDescriptor::opaque(); }
};

template <typename T>
struct shape_traits<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static ShapeDescriptor describe() {
        return ShapeDescriptor::primitive(std::is_same_v<T, bool> ? "bool" : "number");
    }
};

template <>
struct shape_traits<std::string> {
    static ShapeDescriptor describe() { return ShapeDescriptor::text(); }
};

template <typename T, typename A>
struct shape_traits<std::vector<T, A>> {
    static ShapeDescriptor describe() {
        return ShapeDescriptor::collection_of(shape_traits<T>::describe());
    }
};

template <typename T>
ShapeDescriptor shape_of() {
    return shape_traits<std::decay_t<T>>::describe();
}

} // namespace toolgov

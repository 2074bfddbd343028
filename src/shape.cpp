#include "toolgov/shape.hpp"

#include <algorithm>
#include <cctype>

namespace toolgov {

ShapeDescriptor ShapeDescriptor::primitive(std::string name) {
    ShapeDescriptor s;
    s.kind = Kind::Primitive;
    s.name = std::move(name);
    return s;
}

ShapeDescriptor ShapeDescriptor::text() {
    ShapeDescriptor s;
    s.kind = Kind::Text;
    s.name = "string";
    return s;
}

ShapeDescriptor ShapeDescriptor::date() {
    ShapeDescriptor s;
    s.kind = Kind::Date;
    s.name = "date";
    return s;
}

ShapeDescriptor ShapeDescriptor::collection_of(ShapeDescriptor item) {
    ShapeDescriptor s;
    s.kind = Kind::Collection;
    s.name = "list<" + item.name + ">";
    s.item = std::make_shared<const ShapeDescriptor>(std::move(item));
    return s;
}

ShapeDescriptor ShapeDescriptor::object(std::string name, std::size_t properties,
                                        std::size_t methods) {
    ShapeDescriptor s;
    s.kind = Kind::Object;
    s.name = std::move(name);
    s.property_count = properties;
    s.method_count = methods;
    return s;
}

ShapeDescriptor ShapeDescriptor::response(std::string name) {
    ShapeDescriptor s;
    s.kind = Kind::Response;
    s.name = std::move(name);
    return s;
}

ShapeDescriptor ShapeDescriptor::response(std::string name, ShapeDescriptor item) {
    ShapeDescriptor s = response(std::move(name));
    s.item = std::make_shared<const ShapeDescriptor>(std::move(item));
    return s;
}

ShapeDescriptor ShapeDescriptor::opaque(std::string name) {
    ShapeDescriptor s;
    s.kind = Kind::Opaque;
    s.name = std::move(name);
    return s;
}

bool ShapeDescriptor::looks_like_response() const {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("response") != std::string::npos ||
           lower.find("result") != std::string::npos;
}

} // namespace toolgov
